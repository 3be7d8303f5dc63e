// file_io.hpp - Runbook (rbk) - File Input
// Version 0.1.0
// Copyright 2025 The Runbook (rbk) authors
// Licenced as-is under the MIT licence.

#ifndef RBK_FILE_IO_HPP
#define RBK_FILE_IO_HPP

#include <string>

namespace rbk
{
    // Whole file as bytes. Throws std::runtime_error when it cannot be
    // opened or read, including when the path names a directory.
    std::string read_text_file(std::string const & path);
}

#endif // RBK_FILE_IO_HPP
