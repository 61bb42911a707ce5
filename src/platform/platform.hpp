#pragma once

#include <filesystem>

namespace platform {

// $HOME, falling back to the temp directory when it is unset.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

void sleep_ms(int ms);

} // namespace platform
