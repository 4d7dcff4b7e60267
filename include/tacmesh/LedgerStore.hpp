#ifndef TACMESH_LEDGER_STORE_HPP
#define TACMESH_LEDGER_STORE_HPP

#include "tacmesh/LedgerBlock.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tacmesh {

    /**
     * Flat-file persistence of one node's ledger: the live chain and the
     * archive of superseded blocks. Each file is an exported chain followed by
     * a CRC32 trailer.
     */
    class LedgerStore {
    public:
        explicit LedgerStore(const std::string& dataDirectory = "tacmesh_data");

        // ==== BASIC OPERATIONS ====
        bool initialize();
        bool saveChain(const std::vector<LedgerBlock>& chain);
        bool loadChain(std::vector<LedgerBlock>& chain) const;
        bool saveArchive(const std::vector<LedgerBlock>& archive);
        bool loadArchive(std::vector<LedgerBlock>& archive) const;

        bool hasChain() const;

        // ==== UTILS ====
        bool clearStorage();

        const std::string& directory() const { return dataDir; }

    private:
        bool writeFile(const std::string& filename, const std::vector<LedgerBlock>& chain);
        bool readFile(const std::string& filename, std::vector<LedgerBlock>& chain) const;

        std::string dataDir;
        std::string chainFile;
        std::string archiveFile;
        mutable std::recursive_mutex storageMutex;
    };

} // namespace tacmesh

#endif // TACMESH_LEDGER_STORE_HPP
