#pragma once

namespace distill::cli {

int run_cli(int argc, char **argv);

} // namespace distill::cli
