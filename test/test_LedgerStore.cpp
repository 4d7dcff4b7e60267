#include <gtest/gtest.h>
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Ledger.hpp"
#include "tacmesh/LedgerStore.hpp"
#include "tacmesh/Reconciliation.hpp"
#include "tacmesh/Signer.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace tacmesh;
namespace fs = std::filesystem;

class LedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        testDir = (fs::temp_directory_path() / ("tacmesh_store_" + CryptoBase::randomId(6))).string();
        store = std::make_unique<LedgerStore>(testDir);
        ASSERT_TRUE(store->initialize());

        signer = std::make_unique<Ed25519Signer>("alpha", ring);
        ledger = std::make_unique<Ledger>("net-1", clock, *signer);
        for (int i = 0; i < 3; ++i) {
            ledger->append({MeshMessage::create(*signer, MessageType::STATUS, {static_cast<uint8_t>(i)}, "",
                                                clock.stamp())});
        }
    }

    void TearDown() override {
        store.reset();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    std::string testDir;
    std::unique_ptr<LedgerStore> store;
    KeyRing ring;
    ClockService clock{"alpha"};
    std::unique_ptr<Ed25519Signer> signer;
    std::unique_ptr<Ledger> ledger;
};

TEST_F(LedgerStoreTest, SaveAndLoadChain) {
    EXPECT_FALSE(store->hasChain());
    ASSERT_TRUE(store->saveChain(ledger->blocks()));
    EXPECT_TRUE(store->hasChain());

    std::vector<LedgerBlock> loaded;
    ASSERT_TRUE(store->loadChain(loaded));
    ASSERT_EQ(loaded.size(), 4u);
    EXPECT_EQ(loaded.back().hash(), ledger->tip().hash());
    EXPECT_TRUE(Ledger::validate(loaded, signer.get()).valid);

    // a fresh ledger for the same network takes it back
    ClockService freshClock("alpha");
    Ledger restored("net-1", freshClock, *signer);
    EXPECT_TRUE(restored.restore(loaded, {}));
    EXPECT_EQ(restored.size(), 4u);
}

TEST_F(LedgerStoreTest, RefusesToSaveBrokenChain) {
    std::vector<LedgerBlock> chain = ledger->blocks();
    chain.erase(chain.begin() + 1);
    EXPECT_FALSE(store->saveChain(chain));
    EXPECT_FALSE(store->hasChain());
}

TEST_F(LedgerStoreTest, DetectsCorruptedFile) {
    ASSERT_TRUE(store->saveChain(ledger->blocks()));
    const std::string path = testDir + "/chain.bin";
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(file.good());
        file.seekp(20);
        char byte = 0x5A;
        file.write(&byte, 1);
    }

    std::vector<LedgerBlock> loaded;
    EXPECT_FALSE(store->loadChain(loaded));
}

TEST_F(LedgerStoreTest, ArchiveIsOptional) {
    std::vector<LedgerBlock> archive;
    EXPECT_TRUE(store->loadArchive(archive));
    EXPECT_TRUE(archive.empty());

    std::vector<LedgerBlock> superseded{ledger->blocks()[1].markedSuperseded()};
    ASSERT_TRUE(store->saveArchive(superseded));
    ASSERT_TRUE(store->loadArchive(archive));
    ASSERT_EQ(archive.size(), 1u);
    EXPECT_TRUE(archive.front().superseded());
}

TEST_F(LedgerStoreTest, ClearStorageRemovesFiles) {
    ASSERT_TRUE(store->saveChain(ledger->blocks()));
    ASSERT_TRUE(store->clearStorage());
    EXPECT_FALSE(store->hasChain());

    std::vector<LedgerBlock> loaded;
    EXPECT_FALSE(store->loadChain(loaded));
}
