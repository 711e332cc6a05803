#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Writes all @p count bytes from @p buf to @p fd unless an error occurs.
// Returns the number of bytes written, errno is 0 on success.
size_t write_all(int fd, const void* buf, size_t count) noexcept;

// Reads @p fd until EOF. Throws std::runtime_error on error
std::string get_file_contents(int fd);

// Throws std::runtime_error on error
std::string get_file_contents(const std::string& pathname);

// Creates or truncates the file @p pathname. Throws std::runtime_error on error
void put_file_contents(const std::string& pathname, std::string_view data);
