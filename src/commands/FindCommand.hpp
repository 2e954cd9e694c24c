#include "Command.hpp"

#include <cstdint>

#define FIND_CMD_NAME "find"

// longest accepted -n, the window buffer is allocated up front
#define FIND_MAX_LENGTH 4096

class InputStream;
struct ScanConfig;

class FindCommand : public Command {
public:
    int run() override;

    // scans an already open stream with the parsed options, the filename argument is ignored
    int run(InputStream& in, uint64_t size = 0);

private:
    static FindCommand instance; // Static instance to trigger registration
    FindCommand(bool reg=false);
    int get_config(ScanConfig& cfg);
    int scan(InputStream& in, const ScanConfig& cfg, uint64_t size);

    friend class CmdTestBase<FindCommand>;
};
