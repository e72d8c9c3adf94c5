#pragma once

namespace rmount::cli {

int run_cli(int argc, char **argv);

} // namespace rmount::cli
