#include "tacmesh/LedgerStore.hpp"
#include "tacmesh/Frame.hpp"
#include "tacmesh/Ledger.hpp"
#include "tacmesh/Serialization.hpp"
#include "tacmesh/Types.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace tacmesh {

LedgerStore::LedgerStore(const std::string& dataDirectory) : dataDir(dataDirectory) {
    chainFile = dataDir + "/chain.bin";
    archiveFile = dataDir + "/superseded.bin";
}

// ==== BASIC OPERATIONS ====

bool LedgerStore::initialize() {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    try {
        fs::create_directories(dataDir);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error creating directories: " << e.what() << std::endl;
        return false;
    }
}

bool LedgerStore::saveChain(const std::vector<LedgerBlock>& chain) {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    ChainValidation check = Ledger::validate(chain);
    if (!check) {
        std::cerr << "Error: Cannot save invalid chain (index " << check.offendingIndex
                  << ": " << check.reason << ")" << std::endl;
        return false;
    }
    return writeFile(chainFile, chain);
}

bool LedgerStore::loadChain(std::vector<LedgerBlock>& chain) const {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    return readFile(chainFile, chain);
}

bool LedgerStore::saveArchive(const std::vector<LedgerBlock>& archive) {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    return writeFile(archiveFile, archive);
}

bool LedgerStore::loadArchive(std::vector<LedgerBlock>& archive) const {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    if (!fs::exists(archiveFile)) {
        archive.clear();
        return true;
    }
    return readFile(archiveFile, archive);
}

bool LedgerStore::hasChain() const {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    return fs::exists(chainFile);
}

// ==== UTILS ====

bool LedgerStore::clearStorage() {
    std::lock_guard<std::recursive_mutex> lock(storageMutex);
    try {
        fs::remove(chainFile);
        fs::remove(archiveFile);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error clearing storage: " << e.what() << std::endl;
        return false;
    }
}

// ==== FILE FORMAT ====

bool LedgerStore::writeFile(const std::string& filename, const std::vector<LedgerBlock>& chain) {
    try {
        std::vector<uint8_t> data = Ledger::exportChain(chain);
        if (data.size() + CHECKSUM_SIZE > MAX_CHAIN_FILE_SIZE) {
            std::cerr << "Error: Serialized chain exceeds maximum file size" << std::endl;
            return false;
        }

        uint32_t checksumBigEndian = hton32(crc32_buf(data.data(), data.size()));
        const std::string tmpName = filename + ".tmp";
        {
            std::ofstream file(tmpName, std::ios::binary | std::ios::trunc);
            if (!file) {
                std::cerr << "Error: Cannot create file: " << tmpName << std::endl;
                return false;
            }
            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            file.write(reinterpret_cast<const char*>(&checksumBigEndian), CHECKSUM_SIZE);
            if (!file.good()) {
                std::cerr << "Error: Failed to write " << tmpName << std::endl;
                return false;
            }
        }
        fs::rename(tmpName, filename);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error saving " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

bool LedgerStore::readFile(const std::string& filename, std::vector<LedgerBlock>& chain) const {
    if (!fs::exists(filename)) return false;

    std::ifstream file(filename, std::ios::binary | std::ios::ate);
    if (!file) return false;

    std::streamsize size = file.tellg();
    if (size < static_cast<std::streamsize>(CHECKSUM_SIZE) ||
        static_cast<size_t>(size) > MAX_CHAIN_FILE_SIZE) {
        std::cerr << "Error: Bad file size for " << filename << std::endl;
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) return false;

    const size_t dataSize = buffer.size() - CHECKSUM_SIZE;
    uint32_t storedBigEndian;
    std::memcpy(&storedBigEndian, &buffer[dataSize], CHECKSUM_SIZE);
    if (ntoh32(storedBigEndian) != crc32_buf(buffer.data(), dataSize)) {
        std::cerr << "Error: Checksum mismatch in " << filename << std::endl;
        return false;
    }
    buffer.resize(dataSize);

    try {
        chain = Ledger::importChain(buffer);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace tacmesh
