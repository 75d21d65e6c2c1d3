#pragma once
#include <string>
#include <vector>
#include <cstddef>

/**
 * Simple utility to read an entire file (scene JSON, dumped buffers, etc.)
 * into a vector<char>. Throws std::runtime_error if the file cannot be read.
 */
std::vector<char> readFile(const std::string& filename);

/**
 * Write `bytes` bytes from `data` to `filename`, replacing any existing file.
 * Throws std::runtime_error on failure.
 */
void writeBinaryFile(const std::string& filename, const void* data, size_t bytes);

template <typename T>
void writeBinaryFile(const std::string& filename, const std::vector<T>& v)
{
    writeBinaryFile(filename, v.data(), v.size() * sizeof(T));
}
