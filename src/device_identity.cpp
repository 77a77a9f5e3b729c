#include "hemascan/device_identity.hpp"

#include "hemascan/errors.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>

namespace hemascan {
namespace {

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

void fillRandom(std::array<std::uint8_t, 16> &bytes)
{
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
        return;
    }
    std::random_device device;
    for (auto &byte : bytes) {
        byte = static_cast<std::uint8_t>(device() & 0xFF);
    }
}

} // namespace

std::string generateUuid()
{
    std::array<std::uint8_t, 16> bytes{};
    fillRandom(bytes);
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buffer);
}

DeviceIdentity DeviceIdentity::loadOrCreate(const std::string &path)
{
    std::ifstream input(path);
    if (input) {
        std::string line;
        std::getline(input, line);
        std::string id = trim(line);
        if (!id.empty()) {
            return DeviceIdentity(id);
        }
    }

    std::string id = generateUuid();
    std::filesystem::path file(path);
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
    }
    std::ofstream output(path, std::ios::trunc);
    if (!output || !(output << id << "\n")) {
        throw PersistenceError("Failed to store device id at " + path);
    }
    std::cout << "[SYNC] Created device id " << id << std::endl;
    return DeviceIdentity(id);
}

} // namespace hemascan
