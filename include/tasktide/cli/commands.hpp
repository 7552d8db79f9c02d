#pragma once

namespace tasktide::cli {

int run_cli(int argc, char **argv);

} // namespace tasktide::cli
