#include "FileUtils.hpp"
#include <fstream>
#include <stdexcept>

std::vector<char> readFile(const std::string& filename)
{
    std::ifstream file(filename, std::ios::ate | std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("failed to open file: " + filename);

    size_t fileSize = (size_t)file.tellg();
    std::vector<char> buffer(fileSize);
    file.seekg(0);
    file.read(buffer.data(), (std::streamsize)fileSize);
    if (!file)
        throw std::runtime_error("failed to read file: " + filename);
    return buffer;
}

void writeBinaryFile(const std::string& filename, const void* data, size_t bytes)
{
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        throw std::runtime_error("failed to create file: " + filename);

    file.write(static_cast<const char*>(data), (std::streamsize)bytes);
    if (!file)
        throw std::runtime_error("failed to write file: " + filename);
}
