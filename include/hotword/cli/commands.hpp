#pragma once

namespace hotword::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace hotword::cli
