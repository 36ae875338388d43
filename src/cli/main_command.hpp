#pragma once

#include <CLI/CLI.hpp>
#include <string>

namespace symiosis {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    void printHelp() const;

protected:
    CLI::App* app_ = nullptr;
};

}}
