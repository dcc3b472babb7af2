#pragma once

namespace hzip::cli {

int run(int argc, char** argv);

} // namespace hzip::cli
