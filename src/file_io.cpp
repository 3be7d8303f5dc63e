// file_io.cpp - Runbook (rbk) - File Input
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#include "file_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rbk
{
    std::string read_text_file(std::string const & path)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec))
            throw std::runtime_error("Failed to read file: " + path + " (is a directory)");

        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
            throw std::runtime_error("Failed to read file: " + path);

        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            throw std::runtime_error("Failed to read file: " + path);

        return ss.str();
    }
}
