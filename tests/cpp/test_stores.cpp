#include <gtest/gtest.h>
#include "blobio/BufferedReader.hpp"
#include "blobio/Errors.hpp"
#include "blobio/FileStore.hpp"
#include "blobio/MemoryStore.hpp"
#include "TestUtils.hpp"

#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace blobio;
using namespace blobio::test;

namespace
{
    /**
     * @brief Temporary file holding the given bytes, removed on destruction.
     */
    class TempFile
    {
    public:
        explicit TempFile(const std::vector<uint8_t>& bytes)
        {
            char path[] = "/tmp/blobio_test_XXXXXX";
            m_fd = ::mkstemp(path);
            if (m_fd < 0)
            {
                throw std::runtime_error("mkstemp failed");
            }
            m_path = path;
            size_t done = 0;
            while (done < bytes.size())
            {
                ssize_t n = ::write(m_fd, bytes.data() + done, bytes.size() - done);
                if (n <= 0)
                {
                    throw std::runtime_error("write failed for " + m_path);
                }
                done += static_cast<size_t>(n);
            }
        }

        ~TempFile()
        {
            ::close(m_fd);
            ::unlink(m_path.c_str());
        }

        int fd() const { return m_fd; }
        const std::string& path() const { return m_path; }

    private:
        int m_fd = -1;
        std::string m_path;
    };

    /**
     * @brief Store whose next fetch fills half the region, scribbles over
     * the rest and then fails, once armed.
     */
    class FailingStore : public BackingStore
    {
    public:
        FailingStore(std::unique_ptr<BackingStore> inner, std::shared_ptr<bool> armed)
            : m_inner(std::move(inner)), m_armed(std::move(armed))
        {
        }

        void fetch(uint8_t* dst, size_t length) override
        {
            if (!*m_armed)
            {
                m_inner->fetch(dst, length);
                return;
            }
            *m_armed = false;
            size_t half = length / 2;
            m_inner->fetch(dst, half);
            std::fill(dst + half, dst + length, uint8_t{0xEE});
            throw BackingStoreError("injected failure in " + m_inner->describe());
        }

        void reposition(int64_t offset) override { m_inner->reposition(offset); }
        int64_t length() const override { return m_inner->length(); }

        std::unique_ptr<BackingStore> clone() const override
        {
            return std::make_unique<FailingStore>(m_inner->clone(), m_armed);
        }

        std::string describe() const override { return m_inner->describe(); }

    private:
        std::unique_ptr<BackingStore> m_inner;
        std::shared_ptr<bool> m_armed;
    };
}

// --- MemoryStore ---

TEST(MemoryStore, FetchAdvancesCursor) {
    std::vector<uint8_t> data = sequentialBytes(10);
    MemoryStore store(data, "mem");
    uint8_t out[4];
    store.fetch(out, 4);
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[3], 3);
    EXPECT_EQ(store.cursor(), 4);
    store.reposition(8);
    store.fetch(out, 2);
    EXPECT_EQ(out[0], 8);
    EXPECT_EQ(out[1], 9);
    EXPECT_EQ(store.length(), 10);
    EXPECT_EQ(store.describe(), "mem");
}

TEST(MemoryStore, ShortFetchThrows) {
    std::vector<uint8_t> data = sequentialBytes(10);
    MemoryStore store(data);
    store.reposition(8);
    uint8_t out[4];
    EXPECT_THROW(store.fetch(out, 4), BackingStoreError);
}

TEST(MemoryStore, CloneHasOwnCursor) {
    std::vector<uint8_t> data = sequentialBytes(10);
    MemoryStore store(data);
    store.reposition(6);
    auto other = store.clone();
    uint8_t a = 0, b = 0;
    other->fetch(&a, 1);
    store.fetch(&b, 1);
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 6);
}

// --- FileStore ---

TEST(FileStore, ReaderOverFile) {
    ByteSink sink;
    sink.writeInt(7);
    sink.writeVLong(1234567890123LL);
    sink.writeShort(-3);
    TempFile file(sink.bytes());

    BufferedReader reader(std::make_unique<FileStore>(file.fd(), file.path()), kMinBufferSize);
    EXPECT_EQ(reader.length(), static_cast<int64_t>(sink.size()));
    EXPECT_EQ(reader.readInt(), 7);
    EXPECT_EQ(reader.readVLong(), 1234567890123LL);
    EXPECT_EQ(reader.readShort(), -3);
    EXPECT_THROW(reader.readByte(), EndOfDataError);
    EXPECT_EQ(reader.toString(), file.path());
}

TEST(FileStore, FileShrunkUnderReaderPropagatesStoreError) {
    TempFile file(sequentialBytes(64));
    BufferedReader reader(std::make_unique<FileStore>(file.fd(), file.path()), 16);
    ASSERT_EQ(::ftruncate(file.fd(), 20), 0);

    EXPECT_EQ(reader.readInt(), 0x03020100);
    reader.seek(16);
    EXPECT_THROW(reader.readInt(), BackingStoreError);
    EXPECT_EQ(reader.getPosition(), 16);

    // The bytes that are still there remain readable.
    reader.seek(0);
    EXPECT_EQ(reader.readInt(), 0x03020100);
    EXPECT_EQ(reader.readInt(int64_t{12}), 0x0F0E0D0C);
}

TEST(FileStore, ExplicitLengthBoundsReads) {
    TempFile file(sequentialBytes(64));
    BufferedReader reader(std::make_unique<FileStore>(file.fd(), file.path(), 20), 8);
    EXPECT_EQ(reader.length(), 20);
    EXPECT_EQ(reader.readInt(int64_t{16}), 0x13121110);
    EXPECT_THROW(reader.readByte(int64_t{20}), EndOfDataError);
    EXPECT_EQ(reader.clone().length(), 20);
}

TEST(StoreFailure, FailedRefillLeavesNoPartialWindow) {
    std::vector<uint8_t> data = sequentialBytes(64);
    auto armed = std::make_shared<bool>(false);
    BufferedReader reader(
        std::make_unique<FailingStore>(std::make_unique<MemoryStore>(std::span<const uint8_t>(data)), armed),
        16
    );

    EXPECT_EQ(reader.readInt(), 0x03020100); // window [0, 16)
    reader.seek(16);
    *armed = true;
    EXPECT_THROW(reader.readInt(), BackingStoreError);
    EXPECT_EQ(reader.getPosition(), 16);

    // Retrying in place reads the store again rather than the scribbled region.
    EXPECT_EQ(reader.readInt(), 0x13121110);
    EXPECT_EQ(reader.readLong(int64_t{24}), 0x1F1E1D1C1B1A1918LL);

    *armed = true;
    reader.seek(40);
    EXPECT_THROW(reader.readLong(), BackingStoreError);
    EXPECT_EQ(reader.getPosition(), 40);
    reader.seek(4);
    EXPECT_EQ(reader.readInt(), 0x07060504);
    EXPECT_EQ(reader.readInt(int64_t{44}), 0x2F2E2D2C);
}

TEST(FileStore, BadDescriptorRejected) {
    EXPECT_THROW(FileStore(-1, "nothing"), BackingStoreError);
}

TEST(FileStore, ClonesReadConcurrently) {
    ByteSink sink;
    for (int32_t i = 0; i < 4096; ++i) sink.writeInt(i);
    TempFile file(sink.bytes());

    BufferedReader reader(std::make_unique<FileStore>(file.fd(), file.path()), 64);
    std::vector<BufferedReader> clones;
    for (int t = 0; t < 4; ++t)
    {
        reader.seek(static_cast<int64_t>(t) * 4096);
        clones.push_back(reader.clone());
    }

    std::vector<int> mismatches(clones.size(), 0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < clones.size(); ++t)
    {
        threads.emplace_back([&, t]() {
            BufferedReader& r = clones[t];
            int32_t first = static_cast<int32_t>(t) * 1024;
            for (int32_t i = 0; i < 1024; ++i)
            {
                if (r.readInt() != first + i) mismatches[t]++;
            }
            // And backwards, positionally.
            for (int32_t i = 1023; i >= 0; --i)
            {
                if (r.readInt(static_cast<int64_t>(first + i) * 4) != first + i) mismatches[t]++;
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int m : mismatches) EXPECT_EQ(m, 0);
}
