#pragma once
#include "utils/common.hpp"
#include "checksum/Checksum.hpp"

#include <map>
#include <stdexcept>
#include <string>

#define REGISTER_COMMAND(klass)                 \
    klass klass::instance(true);                \
    extern "C" void force_link_##klass() {}     // Define function to force linker to keep TU

// for declaring friends like "friend class CmdTestBase<FindCommand>"
template<typename T> class CmdTestBase;

class Command {
    public:
        virtual int run() = 0;
        virtual ~Command() {}

        static std::map<std::string, Command*>& registry() {
            static std::map<std::string, Command*> registry;
            return registry;
        }

        argparse::ArgumentParser& parser() {
            return m_parser;
        }

    protected:
        Command(bool reg, const char* name, const char* description) : m_parser(name, "", argparse::default_arguments::help) {
            m_parser.add_description(description);
            register_common_args(m_parser);
            if( reg ){
                if( registry().find(name) != registry().end() ){
                    throw std::runtime_error("Command already registered: " + std::string(name));
                }
                registry()[name] = this;
            }
        }

        // -m/--mod10 and -a/--algorithm, shared by the commands that validate
        void add_algorithm_args() {
            m_parser.add_argument("-m", "--mod10")
                .help("use a simple sum modulus 10 instead of the Luhn algorithm")
                .default_value(false)
                .implicit_value(true);
            m_parser.add_argument("-a", "--algorithm")
                .help("checksum algorithm: luhn or mod10")
                .default_value(std::string{"luhn"});
        }

        // --mod10 wins over --algorithm, throws std::invalid_argument on unknown names
        Checksum::Algorithm get_algorithm() {
            if( m_parser.get<bool>("--mod10") ){
                return Checksum::Algorithm::Mod10;
            }
            return Checksum::parse_algorithm(m_parser.get<std::string>("--algorithm"));
        }

        argparse::ArgumentParser m_parser;
};
