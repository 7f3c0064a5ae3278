#pragma once
/*
 * File I/O
 *
 * Purpose: read whole files via mmap (lines with CRLF normalized, or raw text)
 * and write files safely (write .tmp -> fdatasync -> atomic rename).
 * Usage: every call returns false with a human readable msg on failure.
 */
#include <vector>
#include <string>
#include <filesystem>

bool read_file_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg);

bool read_file_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg);

bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& content,
                       std::string& msg);

std::vector<std::string> split_lines(const std::string& text);
