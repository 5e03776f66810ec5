#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "lostore/storage/lo_stream.hpp"
#include "test_support.hpp"

using namespace lostore::core;
using namespace lostore::storage;
using lostore::testing::MemoryStoreTest;

namespace {

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

// Streams only live inside a transaction; each test runs in one that is
// rolled back afterwards.
class LoStreamTest : public MemoryStoreTest {
protected:
    void SetUp() override {
        MemoryStoreTest::SetUp();
        ASSERT_TRUE(is_ok(sqlite_->begin()));
    }

    void TearDown() override {
        if (sqlite_->in_transaction()) {
            EXPECT_TRUE(is_ok(sqlite_->rollback()));
        }
    }

    // Creates an object holding `content` and returns its loid.
    Loid make_object(const std::string& content, const char* original = "") {
        LoStream s(conns(), kLoidNew);
        EXPECT_TRUE(is_ok(s.open(OpenMode::Write, original)));
        const Bytes data = to_bytes(content);
        const BufferView view = view_of(data);
        EXPECT_TRUE(is_ok(s.write_all(&view, 1)));
        EXPECT_TRUE(is_ok(s.close()));
        counting_->reset();
        return s.loid();
    }

    i64 tell(LoStream& s) {
        i64 pos = -1;
        EXPECT_TRUE(is_ok(s.tell(&pos)));
        return pos;
    }
};

} // namespace

//=============================================================================
// Open / close
//=============================================================================

TEST_F(LoStreamTest, CreateAssignsNameFromSuffixes) {
    LoStream s(conns(), kLoidNew);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Write, "archive.tar.gz")));
    EXPECT_FALSE(loid_is_new(s.loid()));
    EXPECT_EQ(s.name(), std::to_string(s.loid().v) + ".tar.gz");
    EXPECT_EQ(counting_->counts.create, 1);
    EXPECT_EQ(counting_->counts.open, 1);
    EXPECT_EQ(counting_->counts.lseek, 0);
    EXPECT_TRUE(s.writable());
    EXPECT_FALSE(s.readable());
    ASSERT_TRUE(is_ok(s.close()));
}

TEST_F(LoStreamTest, ReadModeCannotCreate) {
    LoStream s(conns(), kLoidNew);
    EXPECT_EQ(s.open(OpenMode::Read).code, StatusCode::InvalidMode);
    EXPECT_EQ(counting_->counts.total(), 0);
    EXPECT_TRUE(s.closed());
}

TEST_F(LoStreamTest, UpdateModeCannotCreate) {
    OpenMode mode{};
    ASSERT_TRUE(is_ok(parse_open_mode("r+b", &mode)));
    LoStream s(conns(), kLoidNew);
    EXPECT_EQ(s.open(mode, "x.txt").code, StatusCode::InvalidMode);
    EXPECT_EQ(counting_->counts.total(), 0);
    EXPECT_TRUE(s.closed());
    EXPECT_TRUE(loid_is_new(s.loid()));
}

TEST_F(LoStreamTest, UpdateModeOpensExistingObject) {
    Loid id = make_object("abc");
    OpenMode mode{};
    ASSERT_TRUE(is_ok(parse_open_mode("r+b", &mode)));
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(mode)));
    EXPECT_TRUE(s.readable());
    EXPECT_TRUE(s.writable());
    EXPECT_STREQ(open_mode_text(s.mode()), "r+b");
    EXPECT_EQ(tell(s), 0);
}

TEST_F(LoStreamTest, OpenOutsideTransactionFailsLocally) {
    Loid id = make_object("abc");
    ASSERT_TRUE(is_ok(sqlite_->commit()));

    LoStream r(conns(), id);
    EXPECT_EQ(r.open(OpenMode::Read).code, StatusCode::Invalid);
    LoStream w(conns(), kLoidNew);
    EXPECT_EQ(w.open(OpenMode::Write, "a.txt").code, StatusCode::Invalid);
    EXPECT_EQ(counting_->counts.total(), 0);
    EXPECT_TRUE(r.closed());
    EXPECT_TRUE(w.closed());
}

TEST_F(LoStreamTest, StreamEndsWithItsTransaction) {
    Loid id = make_object("abc");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(sqlite_->commit()));

    Bytes out;
    EXPECT_EQ(s.read(1, &out).code, StatusCode::Invalid);
}

TEST_F(LoStreamTest, ReopenKeepsAssignedName) {
    LoStream s(conns(), kLoidNew);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Write, "notes.txt")));
    const std::string assigned = s.name();
    EXPECT_EQ(assigned, std::to_string(s.loid().v) + ".txt");
    ASSERT_TRUE(is_ok(s.close()));

    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    EXPECT_EQ(s.name(), assigned);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read, "renamed.txt")));
    EXPECT_EQ(s.name(), "renamed.txt");
}

TEST_F(LoStreamTest, FailedOpenAfterCreateKeepsSentinel) {
    counting_->open_failure = make_status(StatusDomain::Db, StatusCode::Backend, 7);
    LoStream s(conns(), kLoidNew);
    Status st = s.open(OpenMode::Write, "a.txt");
    EXPECT_EQ(st.code, StatusCode::Backend);
    EXPECT_EQ(st.aux, 7u);
    EXPECT_EQ(counting_->counts.create, 1);
    EXPECT_TRUE(s.closed());
    EXPECT_TRUE(loid_is_new(s.loid()));
    EXPECT_TRUE(s.name().empty());
}

TEST_F(LoStreamTest, OpenMissingObject) {
    LoStream s(conns(), Loid{999});
    EXPECT_EQ(s.open(OpenMode::Read).code, StatusCode::NotFound);
    EXPECT_TRUE(s.closed());
}

TEST_F(LoStreamTest, CloseIsIdempotent) {
    Loid id = make_object("abc");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(s.close()));
    ASSERT_TRUE(is_ok(s.close()));
    EXPECT_EQ(counting_->counts.close, 1);
    EXPECT_TRUE(s.closed());
}

TEST_F(LoStreamTest, DestructorReleasesDescriptor) {
    Loid id = make_object("abc");
    {
        LoStream s(conns(), id);
        ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
        EXPECT_EQ(sqlite_->open_descriptors(), 1u);
    }
    EXPECT_EQ(sqlite_->open_descriptors(), 0u);
}

TEST_F(LoStreamTest, ClosedStreamRejectsEverythingLocally) {
    LoStream s(conns(), Loid{1});
    Bytes out;
    i64 pos = 0;
    u64 written = 0;
    EXPECT_EQ(s.read(1, &out).code, StatusCode::Invalid);
    EXPECT_EQ(s.readline(-1, &out).code, StatusCode::Invalid);
    EXPECT_EQ(s.seek(0, Whence::Set, &pos).code, StatusCode::Invalid);
    EXPECT_EQ(s.tell(&pos).code, StatusCode::Invalid);
    EXPECT_EQ(s.size(&pos).code, StatusCode::Invalid);
    EXPECT_EQ(s.write(BufferView{}, &written).code, StatusCode::Invalid);
    EXPECT_EQ(counting_->counts.total(), 0);
}

TEST_F(LoStreamTest, ModeViolationsFailBeforeRoundTrip) {
    Loid id = make_object("abc");
    LoStream r(conns(), id);
    ASSERT_TRUE(is_ok(r.open(OpenMode::Read)));
    counting_->reset();

    const u8 byte = 'x';
    u64 written = 0;
    i64 resolved = 0;
    EXPECT_EQ(r.write(BufferView{&byte, 1}, &written).code, StatusCode::InvalidMode);
    EXPECT_EQ(r.truncate(0, &resolved).code, StatusCode::InvalidMode);
    EXPECT_EQ(counting_->counts.total(), 0);

    LoStream w(conns(), id);
    ASSERT_TRUE(is_ok(w.open(OpenMode::Write)));
    counting_->reset();
    Bytes out;
    EXPECT_EQ(w.read(1, &out).code, StatusCode::InvalidMode);
    EXPECT_EQ(w.readline(-1, &out).code, StatusCode::InvalidMode);
    EXPECT_EQ(counting_->counts.total(), 0);
}

//=============================================================================
// Reading
//=============================================================================

TEST_F(LoStreamTest, ReadCountAndEnd) {
    Loid id = make_object("hello");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    Bytes out;
    ASSERT_TRUE(is_ok(s.read(3, &out)));
    EXPECT_EQ(to_string(out), "hel");
    ASSERT_TRUE(is_ok(s.read(10, &out)));
    EXPECT_EQ(to_string(out), "lo");
    ASSERT_TRUE(is_ok(s.read(10, &out)));
    EXPECT_TRUE(out.empty());
}

TEST_F(LoStreamTest, ReadAllUsesChunks) {
    std::string content(150000, 'a');
    content[70000] = 'b';
    Loid id = make_object(content);
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    counting_->reset();

    Bytes out;
    ASSERT_TRUE(is_ok(s.read(-1, &out)));
    EXPECT_EQ(to_string(out), content);
    // 64K + 64K + remainder; the short chunk ends the loop.
    EXPECT_EQ(counting_->counts.read, 3);
}

TEST_F(LoStreamTest, ReadAllExactChunkMultiple) {
    Loid id = make_object(std::string(kChunkBytes, 'z'));
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    counting_->reset();

    Bytes out;
    ASSERT_TRUE(is_ok(s.read_all(&out)));
    EXPECT_EQ(out.size(), kChunkBytes);
    EXPECT_EQ(counting_->counts.read, 2);
}

TEST_F(LoStreamTest, ReadintoStopsOnSinkError) {
    Loid id = make_object(std::string(200000, 'q'));
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    counting_->reset();

    int calls = 0;
    Status st = s.readinto([&calls](const u8*, u64) {
        ++calls;
        return make_status(StatusDomain::Storage, StatusCode::Io);
    });
    EXPECT_EQ(st.code, StatusCode::Io);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(counting_->counts.read, 1);
}

TEST_F(LoStreamTest, ReadlineHonorsMaxLen) {
    Loid id = make_object("abcd\nef");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    Bytes line;
    ASSERT_TRUE(is_ok(s.readline(3, &line)));
    EXPECT_EQ(to_string(line), "abc");
    EXPECT_EQ(tell(s), 3);

    ASSERT_TRUE(is_ok(s.readline(-1, &line)));
    EXPECT_EQ(to_string(line), "d\n");
    EXPECT_EQ(tell(s), 5);

    ASSERT_TRUE(is_ok(s.readline(-1, &line)));
    EXPECT_EQ(to_string(line), "ef");
    EXPECT_EQ(tell(s), 7);

    ASSERT_TRUE(is_ok(s.readline(-1, &line)));
    EXPECT_TRUE(line.empty());
}

TEST_F(LoStreamTest, ReadlineAfterRewind) {
    Loid id = make_object("abcd\nef");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    Bytes line;
    ASSERT_TRUE(is_ok(s.readline(3, &line)));
    EXPECT_EQ(to_string(line), "abc");
    EXPECT_EQ(tell(s), 3);

    ASSERT_TRUE(is_ok(s.seek(0, Whence::Set, nullptr)));
    ASSERT_TRUE(is_ok(s.readline(-1, &line)));
    EXPECT_EQ(to_string(line), "abcd\n");
    EXPECT_EQ(tell(s), 5);
}

TEST_F(LoStreamTest, ReadlineLongerThanScanUnit) {
    std::string first(200, 'x');
    first += "\n";
    Loid id = make_object(first + "tail");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    Bytes line;
    ASSERT_TRUE(is_ok(s.readline(-1, &line)));
    EXPECT_EQ(to_string(line), first);
    EXPECT_EQ(tell(s), static_cast<i64>(first.size()));
}

TEST_F(LoStreamTest, IterationLeavesStreamAfterEachLine) {
    Loid id = make_object("ab\ncd\ne");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    LineIterator it = s.lines();
    Bytes line;
    bool has = false;
    const char* expected[] = {"ab\n", "cd\n", "e"};
    const i64 positions[] = {3, 6, 7};
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(is_ok(it.next(&line, &has)));
        ASSERT_TRUE(has);
        EXPECT_EQ(to_string(line), expected[i]);
        EXPECT_EQ(tell(s), positions[i]);
    }
    ASSERT_TRUE(is_ok(it.next(&line, &has)));
    EXPECT_FALSE(has);
    ASSERT_TRUE(is_ok(it.next(&line, &has)));
    EXPECT_FALSE(has);
}

TEST_F(LoStreamTest, PartialIterationThenReopen) {
    Loid id = make_object("one\ntwo\nthree\n");
    i64 resume = 0;
    {
        LoStream s(conns(), id);
        ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
        LineIterator it = s.lines();
        Bytes line;
        bool has = false;
        ASSERT_TRUE(is_ok(it.next(&line, &has)));
        resume = tell(s);
        ASSERT_TRUE(is_ok(s.close()));
    }
    EXPECT_EQ(resume, 4);

    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(s.seek(resume, Whence::Set, nullptr)));
    std::vector<Bytes> rest;
    ASSERT_TRUE(is_ok(s.readlines(-1, &rest)));
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(to_string(rest[0]), "two\n");
    EXPECT_EQ(to_string(rest[1]), "three\n");
}

TEST_F(LoStreamTest, IterationAcrossChunkBoundary) {
    std::string a(kChunkBytes - 2, 'a');
    std::string content = a + "\nbbbb\n";
    Loid id = make_object(content);
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    std::vector<Bytes> lines;
    ASSERT_TRUE(is_ok(s.readlines(-1, &lines)));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].size(), kChunkBytes - 1);
    EXPECT_EQ(to_string(lines[1]), "bbbb\n");
    EXPECT_EQ(tell(s), static_cast<i64>(content.size()));
}

TEST_F(LoStreamTest, ReadlinesLimits) {
    Loid id = make_object("1\n2\n3\n");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));

    std::vector<Bytes> lines;
    ASSERT_TRUE(is_ok(s.readlines(0, &lines)));
    EXPECT_TRUE(lines.empty());
    EXPECT_EQ(tell(s), 0);

    ASSERT_TRUE(is_ok(s.readlines(2, &lines)));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(tell(s), 4);
}

//=============================================================================
// Positioning
//=============================================================================

TEST_F(LoStreamTest, TellIsIdempotent) {
    Loid id = make_object("0123456789");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(s.seek(6, Whence::Set, nullptr)));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(tell(s), 6);
    }
    Bytes out;
    ASSERT_TRUE(is_ok(s.read(2, &out)));
    EXPECT_EQ(to_string(out), "67");
    EXPECT_EQ(tell(s), 8);
}

TEST_F(LoStreamTest, SizeLeavesPositionUnchanged) {
    Loid id = make_object("0123456789");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(s.seek(4, Whence::Set, nullptr)));
    counting_->reset();

    i64 size = 0;
    ASSERT_TRUE(is_ok(s.size(&size)));
    EXPECT_EQ(size, 10);
    EXPECT_EQ(counting_->counts.tell, 1);
    EXPECT_EQ(counting_->counts.lseek, 2);
    EXPECT_EQ(tell(s), 4);
}

TEST_F(LoStreamTest, SeekPastEndThenWriteLeavesHole) {
    LoStream s(conns(), kLoidNew);
    ASSERT_TRUE(is_ok(s.open(OpenMode::ReadWrite)));
    i64 pos = 0;
    ASSERT_TRUE(is_ok(s.seek(5, Whence::Set, &pos)));
    EXPECT_EQ(pos, 5);
    const Bytes data = to_bytes("x");
    u64 written = 0;
    ASSERT_TRUE(is_ok(s.write(view_of(data), &written)));
    EXPECT_EQ(written, 1u);

    ASSERT_TRUE(is_ok(s.seek(0, Whence::Set, nullptr)));
    Bytes out;
    ASSERT_TRUE(is_ok(s.read_all(&out)));
    EXPECT_EQ(out, (Bytes{0, 0, 0, 0, 0, 'x'}));
}

//=============================================================================
// Writing / truncation
//=============================================================================

TEST_F(LoStreamTest, WriteModeDoesNotTruncate) {
    Loid id = make_object("abcdef");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Write)));
    const Bytes data = to_bytes("XY");
    u64 written = 0;
    ASSERT_TRUE(is_ok(s.write(view_of(data), &written)));
    ASSERT_TRUE(is_ok(s.close()));

    LoStream r(conns(), id);
    ASSERT_TRUE(is_ok(r.open(OpenMode::Read)));
    Bytes out;
    ASSERT_TRUE(is_ok(r.read_all(&out)));
    EXPECT_EQ(to_string(out), "XYcdef");
}

TEST_F(LoStreamTest, AppendStartsAtEnd) {
    Loid id = make_object("abc");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Append)));
    EXPECT_EQ(tell(s), 3);
    const Bytes data = to_bytes("def");
    const BufferView views[] = {view_of(data), view_of(data)};
    ASSERT_TRUE(is_ok(s.write_all(views, 2)));
    ASSERT_TRUE(is_ok(s.close()));

    LoStream r(conns(), id);
    ASSERT_TRUE(is_ok(r.open(OpenMode::CreateAppend)));
    EXPECT_EQ(tell(r), 9);
    ASSERT_TRUE(is_ok(r.seek(0, Whence::Set, nullptr)));
    Bytes out;
    ASSERT_TRUE(is_ok(r.read_all(&out)));
    EXPECT_EQ(to_string(out), "abcdefdef");
}

TEST_F(LoStreamTest, AppendOnNewObjectSkipsSeek) {
    LoStream s(conns(), kLoidNew);
    ASSERT_TRUE(is_ok(s.open(OpenMode::CreateAppend, "log.txt")));
    EXPECT_EQ(counting_->counts.lseek, 0);
    EXPECT_EQ(tell(s), 0);
}

TEST_F(LoStreamTest, TruncateAtPositionAndExplicit) {
    Loid id = make_object("0123456789");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Update)));
    ASSERT_TRUE(is_ok(s.seek(4, Whence::Set, nullptr)));

    i64 resolved = -1;
    ASSERT_TRUE(is_ok(s.truncate(&resolved)));
    EXPECT_EQ(resolved, 4);
    i64 size = 0;
    ASSERT_TRUE(is_ok(s.size(&size)));
    EXPECT_EQ(size, 4);

    ASSERT_TRUE(is_ok(s.truncate(8, &resolved)));
    EXPECT_EQ(resolved, 8);
    ASSERT_TRUE(is_ok(s.size(&size)));
    EXPECT_EQ(size, 8);

    EXPECT_EQ(s.truncate(-1, &resolved).code, StatusCode::Invalid);
}

TEST_F(LoStreamTest, WrittenChunksReadBackWhole) {
    std::string content;
    for (int i = 0; i < 9000; ++i) {
        content.push_back(static_cast<char>('a' + (i * 7) % 26));
    }
    const Bytes data = to_bytes(content);

    // Uneven write splits, including an empty piece and a page-straddling one.
    const u64 cuts[] = {0, 1, 1, 2047, 2050, 6000, 9000};
    std::vector<BufferView> views;
    for (size_t i = 0; i + 1 < sizeof(cuts) / sizeof(cuts[0]); ++i) {
        views.push_back(BufferView{data.data() + cuts[i], cuts[i + 1] - cuts[i]});
    }
    LoStream w(conns(), kLoidNew);
    ASSERT_TRUE(is_ok(w.open(OpenMode::Write, "blob.bin")));
    ASSERT_TRUE(is_ok(w.write_all(views.data(), views.size())));
    ASSERT_TRUE(is_ok(w.close()));

    for (i64 step : {1, 3, 64, 2048, 4096, 100000}) {
        LoStream r(conns(), w.loid());
        ASSERT_TRUE(is_ok(r.open(OpenMode::Read)));
        Bytes all;
        Bytes piece;
        while (true) {
            ASSERT_TRUE(is_ok(r.read(step, &piece)));
            if (piece.empty()) break;
            all.insert(all.end(), piece.begin(), piece.end());
        }
        EXPECT_EQ(to_string(all), content) << "step " << step;
        ASSERT_TRUE(is_ok(r.read(step, &piece)));
        EXPECT_TRUE(piece.empty());
    }
}

TEST_F(LoStreamTest, ReopenSwitchesMode) {
    Loid id = make_object("data");
    LoStream s(conns(), id);
    ASSERT_TRUE(is_ok(s.open(OpenMode::Read)));
    ASSERT_TRUE(is_ok(s.open(OpenMode::Append)));
    EXPECT_EQ(counting_->counts.close, 1);
    EXPECT_EQ(s.mode(), OpenMode::Append);
    EXPECT_EQ(sqlite_->open_descriptors(), 1u);
}
