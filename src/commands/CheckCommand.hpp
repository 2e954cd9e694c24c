#include "Command.hpp"

class CheckCommand : public Command {
public:
    int run() override;

private:
    static CheckCommand instance; // Static instance to trigger registration
    CheckCommand(bool reg=false);

    friend class CmdTestBase<CheckCommand>;
};
