// Build-time tool: generates registration sources for the sample beans
#include <iostream>

#include "sample/sample_registrar.hpp"
#include "sprig/cli/commands.hpp"

int main(int argc, char* argv[]) {
    auto root = sprig::cli::create_root_command("sample_aot",
                                                &sample::all_registrars);
    return root->execute(argc, argv);
}
