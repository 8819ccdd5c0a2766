#include "atlas/AnalysisService.hpp"
#include "atlas/Bitmap.hpp"
#include "atlas/Clustering.hpp"
#include "atlas/Color.hpp"
#include "atlas/ColorRules.hpp"
#include "atlas/DemoWorld.hpp"
#include "atlas/FrameCompositor.hpp"
#include "atlas/InternTable.hpp"
#include "atlas/Rasterizer.hpp"
#include "atlas/RenderPipeline.hpp"
#include "atlas/Snapshot.hpp"
#include "atlas/TileRecord.hpp"
#include "atlas/TileStore.hpp"
#include "atlas/Viewport.hpp"
#include "atlas/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace atlas;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static TileWrite Paint(int x, int y, const std::string& faction, std::uint32_t color = 0x336699u, bool core = false,
                       const std::string& painter = std::string())
{
  TileWrite w;
  w.x = x;
  w.y = y;
  w.factionId = faction;
  w.color = color;
  w.isCore = core;
  w.paintedBy = painter;
  return w;
}

static std::uint16_t FactionIndex(const TileStore& store, const std::string& id)
{
  const auto fi = store.factions().find(id);
  return fi ? static_cast<std::uint16_t>(*fi) : kNoFaction;
}

// -------------------------------------------------------------------------------------------------
// Tile records and the store
// -------------------------------------------------------------------------------------------------

static void TestTileRecordByteLayout()
{
  TileRecord r;
  r.factionIndex = 0x0102;
  r.color = 0x00A0B0C0u;
  r.paintedBy = 0x11223344u;
  r.overpaint = 3;
  r.flags = kTileFlagCore | kTileFlagCoreificationPending;
  r.paintedAtSeconds = 0x55667788u;
  r.expiry = 1234.5;

  std::uint8_t bytes[kTileRecordBytes] = {};
  PackTileRecord(r, bytes);

  EXPECT_EQ(kTileRecordBytes, static_cast<std::size_t>(24));
  EXPECT_EQ(bytes[0], 0x02);
  EXPECT_EQ(bytes[1], 0x01);
  EXPECT_EQ(bytes[2], 0xC0);
  EXPECT_EQ(bytes[3], 0xB0);
  EXPECT_EQ(bytes[4], 0xA0);
  EXPECT_EQ(bytes[5], 0x00);
  EXPECT_EQ(bytes[6], 0x44);
  EXPECT_EQ(bytes[9], 0x11);
  EXPECT_EQ(bytes[10], 3);
  EXPECT_EQ(bytes[11], 0x03);

  // f64 expiry at 12, u32 paintedAtSeconds at 20.
  double expiry = 0.0;
  std::uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) bits |= static_cast<std::uint64_t>(bytes[12 + i]) << (8 * i);
  std::memcpy(&expiry, &bits, sizeof(expiry));
  EXPECT_EQ(expiry, 1234.5);

  std::uint32_t paintedAt = 0;
  for (int i = 0; i < 4; ++i) paintedAt |= static_cast<std::uint32_t>(bytes[20 + i]) << (8 * i);
  EXPECT_EQ(paintedAt, 0x55667788u);
  EXPECT_EQ(bytes[20], 0x88);
  EXPECT_EQ(bytes[23], 0x55);

  EXPECT_TRUE(UnpackTileRecord(bytes) == r);

  std::uint32_t words[kTileRecordWords] = {};
  PackTileWords(r, words);
  EXPECT_TRUE(UnpackTileWords(words) == r);
  EXPECT_EQ(WordsFactionIndex(words[0]), r.factionIndex);
  EXPECT_EQ(WordsColor(words[0], words[1]), r.color);
  EXPECT_EQ(WordsPaintedBy(words[1], words[2]), r.paintedBy);
  EXPECT_EQ(WordsOverpaint(words[2]), r.overpaint);
  EXPECT_EQ(WordsFlags(words[2]), r.flags);
}

static void TestStoreWriteReadRoundTrip()
{
  TileStore store(8);
  EXPECT_EQ(store.gridSize(), 8);
  EXPECT_EQ(store.version(), 0u);

  for (int y = 0; y < 8; ++y) {
    for (int x = 0; x < 8; ++x) {
      TileWrite w = Paint(x, y, "faction-" + std::to_string((x + y) % 3), 0x010203u * static_cast<std::uint32_t>(x + 1),
                          (x == y), "player-" + std::to_string(x));
      w.overpaint = (x * y) % 5;
      w.coreificationPending = (x == 7);
      w.expiry = 1.7e12 + x * 1000.0 + y;
      w.paintedAtSeconds = 1700000000u + static_cast<std::uint32_t>(y * 8 + x);
      EXPECT_TRUE(store.write(w));

      const std::optional<TileRecord> r = store.read(x, y);
      ASSERT_TRUE(r.has_value());
      EXPECT_EQ(r->color, w.color);
      EXPECT_EQ(static_cast<int>(r->overpaint), w.overpaint);
      EXPECT_EQ(r->isCore(), w.isCore);
      EXPECT_EQ(r->coreificationPending(), w.coreificationPending);
      EXPECT_EQ(r->expiry, w.expiry);
      EXPECT_EQ(r->paintedAtSeconds, w.paintedAtSeconds);

      const std::string* fid = store.factions().idAt(r->factionIndex);
      ASSERT_TRUE(fid != nullptr);
      EXPECT_EQ(*fid, w.factionId);
      const std::string* pid = store.players().idAt(r->paintedBy);
      ASSERT_TRUE(pid != nullptr);
      EXPECT_EQ(*pid, w.paintedBy);
    }
  }
  EXPECT_EQ(store.version(), 64u);

  // Reader slots agree with read().
  const TileReader reader = store.reader();
  EXPECT_EQ(reader.version(), store.version());
  const TileSlot s = reader.slot(3, 4);
  const TileRecord r = *store.read(3, 4);
  EXPECT_EQ(s.factionIndex(), r.factionIndex);
  EXPECT_EQ(s.color(), r.color);
  EXPECT_EQ(s.paintedBy(), r.paintedBy);
  EXPECT_TRUE(s.record() == r);

  // Unowned cells and painter-less writes.
  TileStore blank(4);
  EXPECT_FALSE(blank.read(1, 1)->owned());
  EXPECT_TRUE(blank.write(Paint(1, 1, "solo")));
  EXPECT_EQ(blank.read(1, 1)->paintedBy, kNoPainter);

  // Color is 24-bit; overpaint is clamped.
  TileWrite big = Paint(2, 2, "solo", 0xFF123456u);
  big.overpaint = 9;
  EXPECT_TRUE(blank.write(big));
  EXPECT_EQ(blank.read(2, 2)->color, 0x123456u);
  EXPECT_EQ(blank.read(2, 2)->overpaint, kMaxOverpaint);
}

static void TestStoreOutOfRangeIsNoOp()
{
  TileStore store(6);
  EXPECT_TRUE(store.write(Paint(0, 0, "a")));
  const std::uint64_t v = store.version();

  const int bad[][2] = {{-1, 0}, {0, -1}, {6, 0}, {0, 6}, {100, 100}, {-5, 9}};
  for (const auto& p : bad) {
    EXPECT_FALSE(store.read(p[0], p[1]).has_value());
    EXPECT_FALSE(store.write(Paint(p[0], p[1], "a")));
    EXPECT_FALSE(store.clear(p[0], p[1]));
    EXPECT_EQ(store.reader().factionIndexAt(p[0], p[1]), kNoFaction);
  }
  EXPECT_EQ(store.version(), v);

  const std::vector<TileWrite> batch = {Paint(-1, 2, "a"), Paint(7, 7, "b")};
  EXPECT_EQ(store.writeBatch(batch), static_cast<std::size_t>(0));
  EXPECT_EQ(store.version(), v);

  // Only the out-of-range write was rejected: no faction was interned for it.
  EXPECT_FALSE(store.factions().find("b").has_value());
}

static void TestInternTables()
{
  InternTable t(0u, 3u);
  const auto a1 = t.intern("a");
  const auto a2 = t.intern("a");
  ASSERT_TRUE(a1.has_value() && a2.has_value());
  EXPECT_EQ(*a1, *a2);
  EXPECT_EQ(t.size(), static_cast<std::size_t>(1));

  const auto b = t.intern("b");
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(*a1, *b);
  EXPECT_EQ(t.size(), static_cast<std::size_t>(2));

  EXPECT_FALSE(t.intern("").has_value());
  EXPECT_EQ(t.size(), static_cast<std::size_t>(2));

  EXPECT_TRUE(t.intern("c").has_value());
  EXPECT_TRUE(t.full());
  EXPECT_FALSE(t.intern("d").has_value());
  EXPECT_EQ(*t.intern("a"), *a1);
  EXPECT_EQ(t.revision(), 3u);

  EXPECT_EQ(*t.idAt(*b), std::string("b"));
  EXPECT_TRUE(t.idAt(7u) == nullptr);

  // Player indices start at 1 so 0 stays "nobody".
  TileStore store(4);
  const auto p = store.internPlayer("alice");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, 1u);
  EXPECT_EQ(*store.internPlayer("alice"), 1u);
  EXPECT_EQ(*store.internPlayer("bob"), 2u);

  const auto f = store.internFaction("red");
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(*f, 0);

  store.setPlayerDisplayName("alice", "Alice A.");
  EXPECT_EQ(store.playerDisplayName(1u), std::string("Alice A."));
  EXPECT_EQ(store.playerDisplayName(2u), std::string("bob"));
  EXPECT_EQ(store.playerDisplayName(9u), std::string());
}

static void TestVersionMonotonicity()
{
  TileStore store(5);
  std::uint64_t v = store.version();

  EXPECT_TRUE(store.write(Paint(0, 0, "a")));
  EXPECT_TRUE(store.version() > v);
  v = store.version();

  EXPECT_EQ(store.writeBatch({Paint(1, 0, "a"), Paint(2, 0, "b"), Paint(3, 0, "c")}), static_cast<std::size_t>(3));
  EXPECT_EQ(store.version(), v + 1);
  v = store.version();

  EXPECT_TRUE(store.clear(1, 0));
  EXPECT_FALSE(store.read(1, 0)->owned());
  EXPECT_TRUE(store.version() > v);
  v = store.version();

  TileWrite clearing;
  clearing.x = 2;
  clearing.y = 0;
  clearing.clear = true;
  clearing.factionId = "ignored";
  EXPECT_EQ(store.writeBatch({clearing}), static_cast<std::size_t>(1));
  EXPECT_FALSE(store.read(2, 0)->owned());
  EXPECT_FALSE(store.factions().find("ignored").has_value());
  EXPECT_TRUE(store.version() > v);
  v = store.version();

  std::string err;
  EXPECT_TRUE(store.fullReplace(store.exportSnapshot(), err));
  EXPECT_TRUE(store.version() > v);
}

static void TestCountTilesByFaction()
{
  TileStore store(6);
  store.writeBatch({Paint(0, 0, "a"), Paint(1, 0, "a"), Paint(2, 0, "b"), Paint(0, 5, "a")});
  store.internFaction("c");

  const std::vector<std::uint32_t> counts = store.countTilesByFaction();
  ASSERT_TRUE(counts.size() == 3u);
  EXPECT_EQ(counts[FactionIndex(store, "a")], 3u);
  EXPECT_EQ(counts[FactionIndex(store, "b")], 1u);
  EXPECT_EQ(counts[FactionIndex(store, "c")], 0u);
}

// -------------------------------------------------------------------------------------------------
// Snapshots and fullReplace
// -------------------------------------------------------------------------------------------------

static GridSnapshot SampleSnapshot()
{
  TileStore store(4);
  TileWrite w = Paint(0, 0, "red", 0xFF0000u, true, "alice");
  w.expiry = 1.7e12;
  store.write(w);
  store.write(Paint(1, 0, "red", 0xFF0000u, false, "bob"));
  store.write(Paint(3, 3, "blue", 0x0000FFu, false, "alice"));
  store.setPlayerDisplayName("alice", "Alice");
  return store.exportSnapshot(42.0);
}

static void TestSnapshotCodec()
{
  const GridSnapshot snap = SampleSnapshot();

  std::vector<std::uint8_t> bytes;
  std::string err;
  ASSERT_TRUE(EncodeSnapshot(snap, bytes, err));
  EXPECT_TRUE(bytes.size() > snap.records.size());
  EXPECT_EQ(std::memcmp(bytes.data(), "TMAP", 4), 0);

  GridSnapshot back;
  ASSERT_TRUE(DecodeSnapshot(bytes, back, err));
  EXPECT_EQ(back.gridSize, 4);
  EXPECT_EQ(back.mapVersion, 42.0);
  EXPECT_TRUE(back.factionIds == snap.factionIds);
  ASSERT_TRUE(back.players.size() == 2u);
  EXPECT_EQ(back.players[0].id, std::string("alice"));
  EXPECT_EQ(back.players[0].displayName, std::string("Alice"));
  EXPECT_TRUE(back.records == snap.records);

  // A flipped record byte is caught by the CRC.
  {
    std::vector<std::uint8_t> bad = bytes;
    bad[bad.size() - 10] ^= 0x40u;
    GridSnapshot out;
    out.gridSize = 99;
    EXPECT_FALSE(DecodeSnapshot(bad, out, err));
    EXPECT_TRUE(err.find("CRC") != std::string::npos);
    EXPECT_EQ(out.gridSize, 99);
  }

  {
    std::vector<std::uint8_t> bad = bytes;
    bad[0] = 'X';
    GridSnapshot out;
    EXPECT_FALSE(DecodeSnapshot(bad, out, err));
    EXPECT_TRUE(err.find("magic") != std::string::npos);
  }

  {
    std::vector<std::uint8_t> bad = bytes;
    bad[4] = 77;
    GridSnapshot out;
    EXPECT_FALSE(DecodeSnapshot(bad, out, err));
    EXPECT_TRUE(err.find("version") != std::string::npos);
  }

  for (std::size_t keep : {std::size_t{3}, std::size_t{12}, bytes.size() / 2, bytes.size() - 1}) {
    std::vector<std::uint8_t> bad(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(keep));
    GridSnapshot out;
    EXPECT_FALSE(DecodeSnapshot(bad, out, err));
    EXPECT_FALSE(err.empty());
  }

  // Files.
  const fs::path path = MakeTempPath("faction_atlas_snapshot") += ".tmap";
  ASSERT_TRUE(WriteSnapshotFile(path.string(), snap, err));
  GridSnapshot fromFile;
  ASSERT_TRUE(ReadSnapshotFile(path.string(), fromFile, err));
  EXPECT_TRUE(fromFile.records == snap.records);
  std::error_code ec;
  fs::remove(path, ec);

  GridSnapshot missing;
  EXPECT_FALSE(ReadSnapshotFile((MakeTempPath("faction_atlas_missing") / "nope.tmap").string(), missing, err));
}

static void TestFullReplaceRemapsIdentities()
{
  const GridSnapshot snap = SampleSnapshot();

  // The target already knows "blue" (at a different index) and an unrelated faction.
  TileStore store(4);
  store.internFaction("green");
  store.internFaction("blue");
  store.internPlayer("zed");
  const std::uint16_t blueBefore = FactionIndex(store, "blue");

  std::string err;
  ASSERT_TRUE(store.fullReplace(snap, err));
  EXPECT_EQ(store.version(), 1u);

  // Live indices are never renumbered.
  EXPECT_EQ(FactionIndex(store, "blue"), blueBefore);

  const TileRecord a = *store.read(0, 0);
  EXPECT_EQ(*store.factions().idAt(a.factionIndex), std::string("red"));
  EXPECT_EQ(*store.players().idAt(a.paintedBy), std::string("alice"));
  EXPECT_TRUE(a.isCore());
  EXPECT_EQ(a.expiry, 1.7e12);

  const TileRecord b = *store.read(3, 3);
  EXPECT_EQ(*store.factions().idAt(b.factionIndex), std::string("blue"));
  EXPECT_EQ(store.playerDisplayName(a.paintedBy), std::string("Alice"));
  EXPECT_FALSE(store.read(2, 2)->owned());

  // Export after the remap decodes back to the same ownership picture.
  const GridSnapshot again = store.exportSnapshot();
  TileStore copy(4);
  ASSERT_TRUE(copy.fullReplace(again, err));
  EXPECT_EQ(*copy.factions().idAt(copy.read(3, 3)->factionIndex), std::string("blue"));
}

static void TestFullReplaceRejectsInvalidSnapshots()
{
  const GridSnapshot good = SampleSnapshot();

  TileStore store(4);
  store.write(Paint(2, 2, "keep", 0x123456u));
  const std::uint64_t v = store.version();
  const TileRecord before = *store.read(2, 2);
  const std::size_t factionsBefore = store.factions().size();

  auto expectRejected = [&](const GridSnapshot& s, const char* what) {
    std::string err;
    if (store.fullReplace(s, err)) {
      ++g_failures;
      std::cerr << __FILE__ << ":" << __LINE__ << " fullReplace accepted: " << what << "\n";
    }
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(store.version(), v);
    EXPECT_TRUE(*store.read(2, 2) == before);
    EXPECT_EQ(store.factions().size(), factionsBefore);
  };

  {
    TileStore other(5);
    expectRejected(other.exportSnapshot(), "grid size mismatch");
  }
  {
    GridSnapshot s = good;
    s.records.pop_back();
    expectRejected(s, "short records");
  }
  {
    GridSnapshot s = good;
    s.records[10] = 5; // overpaint of cell 0
    expectRejected(s, "overpaint above 4");
  }
  {
    GridSnapshot s = good;
    s.records[11] = 0x80; // flags of cell 0
    expectRejected(s, "unknown flag bits");
  }
  {
    GridSnapshot s = good;
    s.records[0] = 0x10; // faction index 16 with a 2-entry table
    s.records[1] = 0x00;
    expectRejected(s, "faction index out of table");
  }
  {
    GridSnapshot s = good;
    s.records[6] = 99; // painter 99 with a 2-entry table
    expectRejected(s, "painter index out of table");
  }
  {
    GridSnapshot s = good;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::uint64_t bits = 0;
    std::memcpy(&bits, &nan, sizeof(bits));
    // Expiry of cell 0.
    for (int i = 0; i < 8; ++i) s.records[12 + i] = static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu);
    expectRejected(s, "non-finite expiry");
  }
  {
    GridSnapshot s = good;
    s.factionIds.push_back(s.factionIds[0]);
    expectRejected(s, "duplicate faction id");
  }
  {
    GridSnapshot s = good;
    s.factionIds.push_back(std::string());
    expectRejected(s, "empty faction id");
  }
  {
    GridSnapshot s = good;
    s.players.push_back(s.players[0]);
    expectRejected(s, "duplicate player id");
  }

  // Errors name the offending cell.
  {
    GridSnapshot s = good;
    s.records[kTileRecordBytes * 5 + 11] = 0x80; // flags of cell (1,1)
    std::string err;
    EXPECT_FALSE(store.fullReplace(s, err));
    EXPECT_EQ(err, std::string("unknown flag bits at (1,1)"));
  }
}

static void TestFullFactionTableSurvivesSnapshots()
{
  TileStore store(2);
  for (std::uint32_t i = 0; i < kNoFaction; ++i) {
    ASSERT_TRUE(store.internFaction("f" + std::to_string(i)).has_value());
  }
  EXPECT_TRUE(store.factions().full());
  EXPECT_FALSE(store.internFaction("one-more").has_value());
  EXPECT_TRUE(store.write(Paint(1, 1, "f65534")));
  EXPECT_FALSE(store.write(Paint(0, 0, "one-more")));

  const GridSnapshot snap = store.exportSnapshot();
  std::string err;
  EXPECT_TRUE(ValidateSnapshot(snap, 2, err));

  TileStore copy(2);
  ASSERT_TRUE(copy.fullReplace(snap, err));
  EXPECT_EQ(copy.factions().size(), static_cast<std::size_t>(kNoFaction));
  EXPECT_EQ(copy.read(1, 1)->factionIndex, static_cast<std::uint16_t>(65534));
  EXPECT_FALSE(copy.read(0, 0)->owned());

  GridSnapshot over = snap;
  over.factionIds.push_back("f65535");
  EXPECT_FALSE(ValidateSnapshot(over, 2, err));
  EXPECT_EQ(err, std::string("too many factions: 65536"));
}

static void TestRejectedReplaceInternsNothing()
{
  TileStore store(2);
  for (std::uint32_t i = 0; i < kNoFaction - 3u; ++i) store.internFaction("f" + std::to_string(i));
  store.internPlayer("resident");

  TileStore other(2);
  for (int i = 0; i < 5; ++i) other.write(Paint(i % 2, i / 2 % 2, "newcomer" + std::to_string(i), 0x112233u, false,
                                                "visitor" + std::to_string(i)));
  const GridSnapshot snap = other.exportSnapshot();

  const std::size_t factionsBefore = store.factions().size();
  const std::size_t playersBefore = store.players().size();
  const std::uint64_t versionBefore = store.version();

  std::string err;
  EXPECT_FALSE(store.fullReplace(snap, err));
  EXPECT_TRUE(err.find("faction table would overflow") != std::string::npos);
  EXPECT_EQ(store.factions().size(), factionsBefore);
  EXPECT_EQ(store.players().size(), playersBefore);
  EXPECT_FALSE(store.players().find("visitor0").has_value());
  EXPECT_EQ(store.version(), versionBefore);

  // A single write that cannot place its faction leaves the painter out too.
  for (std::uint32_t i = 0; i < 3; ++i) store.internFaction("g" + std::to_string(i));
  EXPECT_TRUE(store.factions().full());
  EXPECT_FALSE(store.write(Paint(0, 0, "late", 0x445566u, false, "latecomer")));
  EXPECT_FALSE(store.players().find("latecomer").has_value());
  EXPECT_EQ(store.players().size(), playersBefore);
}

static void TestReaderKeepsOldRegionAcrossFullReplace()
{
  TileStore store(4);
  store.write(Paint(0, 0, "old"));
  const TileReader pinned = store.reader();
  const std::uint64_t pinnedVersion = pinned.version();

  TileStore source(4);
  source.write(Paint(3, 3, "new"));
  std::string err;
  ASSERT_TRUE(store.fullReplace(source.exportSnapshot(), err));

  EXPECT_EQ(pinned.version(), pinnedVersion);
  EXPECT_EQ(pinned.factionIndexAt(0, 0), FactionIndex(store, "old"));
  EXPECT_EQ(pinned.factionIndexAt(3, 3), kNoFaction);

  const TileReader fresh = store.reader();
  EXPECT_EQ(fresh.factionIndexAt(0, 0), kNoFaction);
  EXPECT_EQ(fresh.factionIndexAt(3, 3), FactionIndex(store, "new"));
}

// -------------------------------------------------------------------------------------------------
// Clustering and borders
// -------------------------------------------------------------------------------------------------

static void TestClusterConnectivity()
{
  {
    TileStore store(3);
    store.writeBatch({Paint(0, 0, "a"), Paint(1, 1, "a")});
    const auto clusters = ComputeFactionClusters(store.reader(), FactionIndex(store, "a"));
    ASSERT_TRUE(clusters.size() == 1u);
    EXPECT_EQ(clusters[0].tileCount, 2);
    EXPECT_NEAR(clusters[0].centroidX, 0.5f, 1e-6f);
    EXPECT_NEAR(clusters[0].centroidY, 0.5f, 1e-6f);
  }
  {
    TileStore store(3);
    store.writeBatch({Paint(0, 0, "a"), Paint(2, 2, "a")});
    const auto clusters = ComputeFactionClusters(store.reader(), FactionIndex(store, "a"));
    ASSERT_TRUE(clusters.size() == 2u);
    EXPECT_EQ(clusters[0].tileCount, 1);
    EXPECT_EQ(clusters[1].tileCount, 1);
    // Equal sizes keep row-major order.
    EXPECT_EQ(clusters[0].firstCell, (Point{0, 0}));
    EXPECT_EQ(clusters[1].firstCell, (Point{2, 2}));
  }
  {
    // Other factions' tiles and unknown factions do not count.
    TileStore store(4);
    store.writeBatch({Paint(0, 0, "a"), Paint(1, 0, "b"), Paint(2, 0, "a")});
    EXPECT_EQ(ComputeFactionClusters(store.reader(), FactionIndex(store, "a")).size(), static_cast<std::size_t>(2));
    EXPECT_TRUE(ComputeFactionClusters(store.reader(), 77).empty());
    EXPECT_TRUE(ComputeFactionClusters(store.reader(), kNoFaction).empty());
  }
}

static void TestPrimaryClusterPrefersCore()
{
  TileStore store(20);
  std::vector<TileWrite> batch;
  for (int x = 0; x < 10; ++x) batch.push_back(Paint(x, 0, "a"));
  batch.push_back(Paint(15, 10, "a", 0x336699u, true));
  batch.push_back(Paint(16, 10, "a"));
  batch.push_back(Paint(15, 11, "a"));
  batch.push_back(Paint(16, 11, "a"));
  store.writeBatch(batch);

  const std::uint16_t fi = FactionIndex(store, "a");
  const auto clusters = ComputeFactionClusters(store.reader(), fi);
  ASSERT_TRUE(clusters.size() == 2u);
  EXPECT_EQ(clusters[0].tileCount, 10);
  EXPECT_FALSE(clusters[0].hasCore);
  EXPECT_EQ(clusters[1].tileCount, 4);
  EXPECT_TRUE(clusters[1].hasCore);
  EXPECT_EQ(clusters[1].bounds.x, 15);
  EXPECT_EQ(clusters[1].bounds.w, 2);

  const auto primary = SelectPrimaryCluster(clusters);
  ASSERT_TRUE(primary.has_value());
  EXPECT_EQ(*primary, static_cast<std::size_t>(1));

  const FactionAnalysis an = AnalyzeFaction(store.reader(), fi);
  ASSERT_TRUE(an.primaryCluster() != nullptr);
  EXPECT_NEAR(an.primaryCluster()->centroidX, 15.5f, 1e-6f);
  EXPECT_NEAR(an.primaryCluster()->centroidY, 10.5f, 1e-6f);
  EXPECT_EQ(an.tileCount, 14);

  // Without cores the largest wins; ties go to the earlier cluster.
  std::vector<FactionCluster> plain(3);
  plain[0].tileCount = 3;
  plain[1].tileCount = 5;
  plain[2].tileCount = 5;
  EXPECT_EQ(*SelectPrimaryCluster(plain), static_cast<std::size_t>(1));
  plain[0].hasCore = true;
  EXPECT_EQ(*SelectPrimaryCluster(plain), static_cast<std::size_t>(0));
  EXPECT_FALSE(SelectPrimaryCluster({}).has_value());
}

static void TestSingleTileHasFourEdges()
{
  TileStore store(5);
  store.write(Paint(2, 2, "a"));
  const auto edges = ExtractBorderEdges(store.reader(), FactionIndex(store, "a"));
  ASSERT_TRUE(edges.size() == 4u);
  EXPECT_TRUE(edges[0] == (BorderEdge{Point{2, 2}, Point{3, 2}, EdgeSide::Top}));
  EXPECT_TRUE(edges[1] == (BorderEdge{Point{2, 3}, Point{3, 3}, EdgeSide::Bottom}));
  EXPECT_TRUE(edges[2] == (BorderEdge{Point{2, 2}, Point{2, 3}, EdgeSide::Left}));
  EXPECT_TRUE(edges[3] == (BorderEdge{Point{3, 2}, Point{3, 3}, EdgeSide::Right}));
  for (const BorderEdge& e : edges) EXPECT_EQ(e.length(), 1);

  // The grid boundary is a border too.
  TileStore corner(3);
  corner.write(Paint(0, 0, "a"));
  EXPECT_EQ(ExtractBorderEdges(corner.reader(), FactionIndex(corner, "a")).size(), static_cast<std::size_t>(4));
}

static void TestWorkedExampleOnFourByFour()
{
  TileStore store(4);
  store.writeBatch({Paint(0, 0, "A"), Paint(0, 1, "A"), Paint(1, 0, "A"), Paint(3, 3, "B")});
  const TileReader reader = store.reader();
  const std::uint16_t a = FactionIndex(store, "A");
  const std::uint16_t b = FactionIndex(store, "B");

  const auto ca = ComputeFactionClusters(reader, a);
  ASSERT_TRUE(ca.size() == 1u);
  EXPECT_EQ(ca[0].tileCount, 3);

  const auto cb = ComputeFactionClusters(reader, b);
  ASSERT_TRUE(cb.size() == 1u);
  EXPECT_EQ(cb[0].tileCount, 1);

  EXPECT_EQ(ExtractBorderEdges(reader, a).size(), static_cast<std::size_t>(8));
  EXPECT_EQ(ExtractBorderEdges(reader, b).size(), static_cast<std::size_t>(4));

  // Merged outline of the L: top run of 2, left run of 2, and four single steps.
  const auto merged = MergeBorderEdges(ExtractBorderEdges(reader, a));
  EXPECT_EQ(merged.size(), static_cast<std::size_t>(6));
  int total = 0;
  for (const BorderEdge& e : merged) total += e.length();
  EXPECT_EQ(total, 8);
}

static void TestMergeBorderEdges()
{
  TileStore store(6);
  store.writeBatch({Paint(1, 1, "a"), Paint(2, 1, "a"), Paint(3, 1, "a")});
  const auto unit = ExtractBorderEdges(store.reader(), FactionIndex(store, "a"));
  EXPECT_EQ(unit.size(), static_cast<std::size_t>(8));

  const auto merged = MergeBorderEdges(unit);
  ASSERT_TRUE(merged.size() == 4u);
  EXPECT_TRUE(merged[0] == (BorderEdge{Point{1, 1}, Point{4, 1}, EdgeSide::Top}));
  EXPECT_TRUE(merged[1] == (BorderEdge{Point{1, 2}, Point{4, 2}, EdgeSide::Bottom}));
  EXPECT_TRUE(merged[2] == (BorderEdge{Point{1, 1}, Point{1, 2}, EdgeSide::Left}));
  EXPECT_TRUE(merged[3] == (BorderEdge{Point{4, 1}, Point{4, 2}, EdgeSide::Right}));

  // Collinear edges with a gap stay apart.
  const std::vector<BorderEdge> gapped = {BorderEdge{Point{0, 0}, Point{1, 0}, EdgeSide::Top},
                                          BorderEdge{Point{2, 0}, Point{3, 0}, EdgeSide::Top}};
  EXPECT_EQ(MergeBorderEdges(gapped).size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(MergeBorderEdges({}).empty());
}

static void TestFindBorderTiles()
{
  // A full 3x3 block: only the centre has no foreign neighbour, but the grid is 3x3
  // so every outer cell's foreign neighbours are off-grid.
  {
    TileStore store(3);
    std::vector<TileWrite> batch;
    for (int y = 0; y < 3; ++y)
      for (int x = 0; x < 3; ++x) batch.push_back(Paint(x, y, "a"));
    store.writeBatch(batch);
    EXPECT_TRUE(FindBorderTiles(store.reader(), FactionIndex(store, "a")).empty());
  }
  {
    TileStore store(5);
    std::vector<TileWrite> batch;
    for (int y = 1; y < 4; ++y)
      for (int x = 1; x < 4; ++x) batch.push_back(Paint(x, y, "a"));
    store.writeBatch(batch);
    const auto tiles = FindBorderTiles(store.reader(), FactionIndex(store, "a"));
    EXPECT_EQ(tiles.size(), static_cast<std::size_t>(8));
    for (const Point& p : tiles) EXPECT_FALSE(p.x == 2 && p.y == 2);
  }
}

static void TestFactionLabels()
{
  TileStore store(10);
  std::vector<TileWrite> batch;
  for (int x = 0; x < 6; ++x) batch.push_back(Paint(x, 0, "A"));
  for (int x = 0; x < 4; ++x) batch.push_back(Paint(x, 9, "B"));
  store.writeBatch(batch);

  MetadataRegistry reg;
  reg.setFaction("A", "Alpha", Rgba8{10, 20, 30, 255});
  const RenderMetadataPtr meta = reg.snapshot(store);

  const auto labels = ComputeFactionLabels(store.reader(), *meta);
  ASSERT_TRUE(labels.size() == 1u);
  EXPECT_EQ(labels[0].factionId, std::string("A"));
  EXPECT_EQ(labels[0].name, std::string("Alpha"));
  EXPECT_TRUE(labels[0].color == (Rgba8{10, 20, 30, 255}));
  EXPECT_NEAR(labels[0].x, 2.5f, 1e-6f);
  EXPECT_NEAR(labels[0].y, 0.0f, 1e-6f);
  EXPECT_EQ(labels[0].tileCount, 6);

  const auto all = ComputeFactionLabels(store.reader(), *meta, 4);
  ASSERT_TRUE(all.size() == 2u);
  EXPECT_EQ(all[1].factionId, std::string("B"));
  EXPECT_EQ(all[1].name, std::string("B"));
}

// -------------------------------------------------------------------------------------------------
// Analysis service
// -------------------------------------------------------------------------------------------------

static void TestAnalysisCacheReturnsIdenticalResult()
{
  TileStore store(8);
  store.writeBatch({Paint(0, 0, "a"), Paint(1, 0, "a"), Paint(5, 5, "a")});
  const std::uint16_t fi = FactionIndex(store, "a");

  AnalysisServiceConfig cfg;
  cfg.forceSingleThreaded = true;
  AnalysisService svc(cfg);
  EXPECT_FALSE(svc.start());

  const AnalysisFuture f1 = svc.query(store.reader(), fi);
  const AnalysisFuture f2 = svc.query(store.reader(), fi);
  EXPECT_EQ(svc.stats().dispatched, 1u);
  EXPECT_EQ(svc.stats().joinedInFlight, 1u);
  EXPECT_EQ(svc.inFlight(), static_cast<std::size_t>(1));

  EXPECT_EQ(svc.pump(), static_cast<std::size_t>(1));
  ASSERT_TRUE(f1.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  ASSERT_TRUE(f2.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  EXPECT_TRUE(f1.get().get() == f2.get().get());

  const FactionAnalysisPtr first = f1.get();
  ASSERT_TRUE(first != nullptr);
  EXPECT_TRUE(first->ok);
  EXPECT_EQ(first->version, store.version());
  EXPECT_EQ(first->tileCount, 3);
  EXPECT_EQ(first->clusters.size(), static_cast<std::size_t>(2));

  // No intervening write: the cached object itself comes back, nothing recomputes.
  const AnalysisFuture f3 = svc.query(store.reader(), fi);
  ASSERT_TRUE(f3.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  EXPECT_TRUE(f3.get().get() == first.get());
  EXPECT_EQ(svc.stats().computed, 1u);
  EXPECT_EQ(svc.stats().cacheHits, 1u);
  EXPECT_TRUE(svc.cached(fi, store.version()) == first);

  // A write moves the version on and forces a new analysis.
  store.write(Paint(2, 0, "a"));
  const AnalysisFuture f4 = svc.query(store.reader(), fi);
  EXPECT_TRUE(svc.waitFor(f4, std::chrono::seconds(5)));
  EXPECT_EQ(svc.stats().computed, 2u);
  EXPECT_EQ(f4.get()->tileCount, 4);
  EXPECT_TRUE(f4.get().get() != first.get());
  EXPECT_TRUE(svc.cached(fi, first->version) == nullptr);
}

static void TestAnalysisOnWorkerPool()
{
  TileStore store(32);
  std::vector<TileWrite> batch;
  for (int y = 0; y < 32; y += 2)
    for (int x = 0; x < 32; ++x) batch.push_back(Paint(x, y, "stripes"));
  store.writeBatch(batch);
  const std::uint16_t fi = FactionIndex(store, "stripes");

  AnalysisServiceConfig cfg;
  cfg.workerCount = 2;
  AnalysisService svc(cfg);
  EXPECT_TRUE(svc.start());

  const AnalysisFuture f = svc.query(store.reader(), fi);
  ASSERT_TRUE(svc.waitFor(f, std::chrono::seconds(10)));
  const FactionAnalysisPtr a = f.get();
  ASSERT_TRUE(a != nullptr);
  EXPECT_TRUE(a->ok);
  EXPECT_EQ(a->tileCount, 16 * 32);
  EXPECT_EQ(a->clusters.size(), static_cast<std::size_t>(16));
  svc.shutdown();
}

static void TestAnalysisFailureKeepsLastGoodResult()
{
  TileStore store(6);
  store.write(Paint(1, 1, "a"));
  const std::uint16_t fi = FactionIndex(store, "a");

  AnalysisServiceConfig cfg;
  cfg.forceSingleThreaded = true;
  AnalysisService svc(cfg);

  auto failing = [](const TileReader&, std::uint16_t) -> FactionAnalysis {
    throw std::runtime_error("injected analysis failure");
  };

  // No previous result: resolves to a failed analysis, nothing cached.
  svc.setAnalyzer(failing);
  const AnalysisFuture f1 = svc.query(store.reader(), fi);
  ASSERT_TRUE(svc.waitFor(f1, std::chrono::seconds(5)));
  EXPECT_FALSE(f1.get()->ok);
  EXPECT_TRUE(f1.get()->error.find("injected") != std::string::npos);
  EXPECT_EQ(svc.stats().failures, 1u);
  EXPECT_EQ(svc.cacheSize(), static_cast<std::size_t>(0));

  svc.setAnalyzer(AnalyzeFaction);
  const AnalysisFuture f2 = svc.query(store.reader(), fi);
  ASSERT_TRUE(svc.waitFor(f2, std::chrono::seconds(5)));
  ASSERT_TRUE(f2.get()->ok);
  const std::uint64_t goodVersion = f2.get()->version;

  // A later failure answers with the last good result.
  store.write(Paint(2, 1, "a"));
  svc.setAnalyzer(failing);
  const AnalysisFuture f3 = svc.query(store.reader(), fi);
  ASSERT_TRUE(svc.waitFor(f3, std::chrono::seconds(5)));
  EXPECT_TRUE(f3.get()->ok);
  EXPECT_EQ(f3.get()->version, goodVersion);
  EXPECT_TRUE(f3.get().get() == f2.get().get());
  EXPECT_EQ(svc.stats().failures, 2u);
  EXPECT_TRUE(svc.cached(fi, store.version()) == nullptr);
}

static void TestAnalysisCacheEviction()
{
  TileStore store(6);
  store.writeBatch({Paint(0, 0, "a"), Paint(2, 0, "b"), Paint(4, 0, "c")});

  AnalysisServiceConfig cfg;
  cfg.forceSingleThreaded = true;
  cfg.cacheCapacity = 2;
  AnalysisService svc(cfg);

  const TileReader reader = store.reader();
  svc.query(reader, FactionIndex(store, "a"));
  svc.query(reader, FactionIndex(store, "b"));
  svc.query(reader, FactionIndex(store, "c"));
  EXPECT_EQ(svc.pump(), static_cast<std::size_t>(3));

  EXPECT_EQ(svc.cacheSize(), static_cast<std::size_t>(2));
  EXPECT_EQ(svc.stats().evictions, 1u);
  EXPECT_TRUE(svc.cached(FactionIndex(store, "a"), reader.version()) == nullptr);
  EXPECT_TRUE(svc.cached(FactionIndex(store, "c"), reader.version()) != nullptr);
}

// -------------------------------------------------------------------------------------------------
// Colors, viewport, rasterizer
// -------------------------------------------------------------------------------------------------

static void TestHexColors()
{
  Rgba8 c;
  EXPECT_TRUE(ParseHexColor("#ff8000", c));
  EXPECT_TRUE(c == (Rgba8{255, 128, 0, 255}));
  EXPECT_TRUE(ParseHexColor("00FF00", c));
  EXPECT_TRUE(c == (Rgba8{0, 255, 0, 255}));
  EXPECT_TRUE(ParseHexColor("#abc", c));
  EXPECT_TRUE(c == (Rgba8{0xAA, 0xBB, 0xCC, 255}));
  EXPECT_FALSE(ParseHexColor("#12345", c));
  EXPECT_FALSE(ParseHexColor("#gg0000", c));
  EXPECT_FALSE(ParseHexColor("", c));
  EXPECT_EQ(FormatHexColor(Rgba8{0x12, 0xAB, 0x0F, 255}), std::string("#12ab0f"));
  EXPECT_EQ(PackRgb(RgbaFromPacked(0x123456u)), 0x123456u);

  EXPECT_TRUE(HslToRgb(0.0f, 1.0f, 0.5f) == (Rgba8{255, 0, 0, 255}));
  EXPECT_TRUE(HslToRgb(120.0f, 1.0f, 0.5f) == (Rgba8{0, 255, 0, 255}));
  EXPECT_TRUE(HslToRgb(-120.0f, 1.0f, 0.5f) == (Rgba8{0, 0, 255, 255}));
}

static void TestColorRuleModes()
{
  TileStore store(4);
  TileWrite core = Paint(0, 0, "red", 0xFF0000u, true, "alice");
  core.overpaint = 4;
  store.write(core);
  store.write(Paint(1, 0, "red", 0xFF0000u, false, "bob"));
  store.write(Paint(2, 0, "loner", 0x00FF00u));

  MetadataRegistry reg;
  reg.setAlliance("north", "The North", Rgba8{1, 2, 3, 255});
  reg.setFaction("red", "Red", Rgba8{200, 0, 0, 255}, "north");
  reg.setPlayerColor("alice", Rgba8{9, 8, 7, 255});
  const RenderMetadataPtr meta = reg.snapshot(store);
  const TileReader reader = store.reader();

  RenderTheme theme;
  theme.blankTile = Rgba8{250, 250, 250, 255};

  {
    const ColorRules rules(theme, meta.get());
    EXPECT_TRUE(rules.resolve(reader.slot(0, 0)) == (Rgba8{255, 0, 0, 255}));
    EXPECT_TRUE(rules.resolve(reader.slot(2, 0)) == (Rgba8{0, 255, 0, 255}));
    EXPECT_TRUE(rules.resolve(reader.slot(3, 3)) == theme.blankTile);
  }
  {
    theme.mode = ColorMode::Player;
    const ColorRules rules(theme, meta.get());
    EXPECT_TRUE(rules.resolve(reader.slot(0, 0)) == (Rgba8{9, 8, 7, 255}));
    EXPECT_TRUE(rules.resolve(reader.slot(1, 0)) == kUnknownPlayerColor);
    EXPECT_TRUE(rules.resolve(reader.slot(2, 0)) == kUnknownPlayerColor);
  }
  {
    theme.mode = ColorMode::Overpaint;
    const ColorRules rules(theme, meta.get());
    EXPECT_TRUE(rules.resolve(reader.slot(0, 0)) == OverpaintColor(4));
    EXPECT_TRUE(rules.resolve(reader.slot(1, 0)) == OverpaintColor(0));
    EXPECT_TRUE(OverpaintColor(0) != OverpaintColor(4));
    EXPECT_TRUE(OverpaintColor(9) == OverpaintColor(4));
    EXPECT_EQ(OverpaintColor(4).r, 255);
    EXPECT_EQ(OverpaintColor(4).b, 255);
  }
  {
    theme.mode = ColorMode::Alliance;
    const ColorRules rules(theme, meta.get());
    EXPECT_TRUE(rules.resolve(reader.slot(0, 0)) == (Rgba8{1, 2, 3, 255}));
    EXPECT_TRUE(rules.resolve(reader.slot(2, 0)) == theme.blankTile);
    EXPECT_TRUE(rules.resolve(reader.slot(3, 3)) == theme.blankTile);
  }
  {
    theme.mode = ColorMode::Faction;
    theme.highlightCoreOnly = true;
    const ColorRules rules(theme, meta.get());
    EXPECT_TRUE(rules.resolve(reader.slot(0, 0)) == (Rgba8{255, 0, 0, 255}));
    EXPECT_TRUE(rules.resolve(reader.slot(1, 0)) == kNonCoreDimColor);
    EXPECT_TRUE(rules.resolve(reader.slot(3, 3)) == theme.blankTile);
  }

  ColorMode m = ColorMode::Faction;
  EXPECT_TRUE(ParseColorMode("OverPaint", m));
  EXPECT_TRUE(m == ColorMode::Overpaint);
  EXPECT_FALSE(ParseColorMode("team", m));
  EXPECT_EQ(std::string(ColorModeName(ColorMode::Alliance)), std::string("alliance"));
}

static void TestMetadataSnapshotsRebuildOnlyOnChange()
{
  TileStore store(4);
  store.write(Paint(0, 0, "red"));

  MetadataRegistry reg;
  reg.setFaction("red", "Red", Rgba8{200, 0, 0, 255});
  const RenderMetadataPtr m1 = reg.snapshot(store);
  const RenderMetadataPtr m2 = reg.snapshot(store);
  EXPECT_TRUE(m1 == m2);
  EXPECT_EQ(reg.rebuilds(), 1u);
  ASSERT_TRUE(m1->faction(0) != nullptr);
  EXPECT_EQ(m1->faction(0)->displayName, std::string("Red"));
  EXPECT_TRUE(m1->faction(5) == nullptr);

  // Tile writes alone do not touch the tables.
  store.write(Paint(1, 0, "red"));
  EXPECT_TRUE(reg.snapshot(store) == m1);

  store.write(Paint(2, 0, "blue"));
  const RenderMetadataPtr m3 = reg.snapshot(store);
  EXPECT_TRUE(m3 != m1);
  EXPECT_EQ(m3->factions.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(m3->factions[1].displayName, std::string("blue"));

  reg.setPlayerColor("p", Rgba8{1, 1, 1, 255});
  EXPECT_TRUE(reg.snapshot(store) != m3);

  // Holders of an old snapshot keep it unchanged.
  EXPECT_EQ(m1->factions.size(), static_cast<std::size_t>(1));
}

static FrameGeometry Geometry(int w, int h, float cx, float cy, float zoom)
{
  FrameGeometry g;
  g.width = w;
  g.height = h;
  g.view.centerX = cx;
  g.view.centerY = cy;
  g.view.zoom = zoom;
  g.baseTilePx = 16.0f;
  return g;
}

static void TestViewportMapping()
{
  // Fractional tile size: neighbouring rectangles meet exactly.
  const FrameGeometry g = Geometry(320, 200, 250.3f, 250.7f, 0.37f);
  for (int x = 240; x < 260; ++x) {
    const IRect a = CellScreenRect(g, x, 250);
    const IRect b = CellScreenRect(g, x + 1, 250);
    EXPECT_EQ(a.x + a.w, b.x);
    EXPECT_EQ(a.y, b.y);
    const IRect c = CellScreenRect(g, x, 251);
    EXPECT_EQ(a.y + a.h, c.y);
  }

  // Grid-line mode leaves one pixel between cells.
  const FrameGeometry big = Geometry(320, 200, 10.0f, 10.0f, 2.5f);
  EXPECT_TRUE(ShowGridLines(big));
  EXPECT_FALSE(ShowGridLines(g));
  const IRect r = CellScreenRect(big, 10, 10);
  EXPECT_EQ(r.w, 39);
  EXPECT_EQ(r.h, 39);
  EXPECT_EQ(r.x, 160);
  EXPECT_EQ(r.y, 100);

  // Screen centre is the camera centre.
  const FrameGeometry c = Geometry(200, 200, 250.0f, 250.0f, 1.0f);
  EXPECT_EQ(ScreenToGrid(c, 100.0, 100.0), (Point{250, 250}));
  EXPECT_EQ(ScreenToGrid(c, 99.0, 100.0), (Point{249, 250}));
  EXPECT_TRUE(ScreenToCell(c, 100.0, 100.0, 500).has_value());
  EXPECT_FALSE(ScreenToCell(c, 100.0, 100.0, 100).has_value());

  const CellRange vr = VisibleCellRange(c, 500);
  EXPECT_TRUE(vr.x0 <= 243 && vr.x1 >= 256);
  EXPECT_TRUE(vr.x1 - vr.x0 <= 20);
  const CellRange clamped = VisibleCellRange(Geometry(200, 200, 0.0f, 0.0f, 1.0f), 500);
  EXPECT_EQ(clamped.x0, 0);
  EXPECT_EQ(clamped.y0, 0);
  EXPECT_TRUE(VisibleCellRange(Geometry(200, 200, -100.0f, -100.0f, 1.0f), 500).empty());

  // Zooming keeps the grid point under the cursor in place.
  ViewportLimits lim;
  const Viewport zoomed = ZoomAround(c, lim, 3.0f, 40.0, 170.0);
  EXPECT_NEAR(zoomed.zoom, 3.0f, 1e-6f);
  FrameGeometry after = c;
  after.view = zoomed;
  const ScreenPos beforeGrid{c.view.centerX + (40.0 - 100.0) / 16.0, c.view.centerY + (170.0 - 100.0) / 16.0};
  const ScreenPos s = GridToScreen(after, beforeGrid.x, beforeGrid.y);
  EXPECT_NEAR(s.x, 40.0, 1e-2);
  EXPECT_NEAR(s.y, 170.0, 1e-2);
  EXPECT_NEAR(ZoomAround(c, lim, 100.0f, 0.0, 0.0).zoom, lim.maxZoom, 1e-6f);

  const Viewport panned = PanByPixels(c, 32.0, -16.0);
  EXPECT_NEAR(panned.centerX, 248.0f, 1e-4f);
  EXPECT_NEAR(panned.centerY, 251.0f, 1e-4f);
}

static void TestRasterPartitionsAreDisjoint()
{
  TileStore store(12);
  std::vector<TileWrite> batch;
  for (int y = 0; y < 12; ++y)
    for (int x = 0; x < 12; ++x) batch.push_back(Paint(x, y, (x < 6) ? "w" : "e", (x < 6) ? 0x0000FFu : 0xFF0000u));
  store.writeBatch(batch);

  MetadataRegistry reg;
  const RenderMetadataPtr meta = reg.snapshot(store);
  RenderTheme theme;
  theme.showSeams = true;
  const ColorRules rules(theme, meta.get());
  const FrameGeometry g = Geometry(100, 90, 6.0f, 6.0f, 0.53f);

  const int parts = 3;
  std::vector<Bitmap> partials(parts);
  std::size_t cells = 0;
  for (int p = 0; p < parts; ++p) cells += RasterizePartition(store.reader(), g, rules, p, parts, partials[p]).cellsDrawn;

  Bitmap whole;
  const RasterStats single = RasterizePartition(store.reader(), g, rules, 0, 1, whole);
  EXPECT_EQ(cells, single.cellsDrawn);
  EXPECT_TRUE(single.seamSegments > 0u);

  std::size_t covered = 0;
  for (const Bitmap& b : partials) covered += b.coveredPixels();
  EXPECT_EQ(covered, whole.coveredPixels());

  for (int y = 0; y < g.height; ++y) {
    for (int x = 0; x < g.width; ++x) {
      int owners = 0;
      for (const Bitmap& b : partials) owners += (b.at(x, y).a > 0) ? 1 : 0;
      EXPECT_TRUE(owners <= 1);
    }
  }

  Bitmap merged(g.width, g.height, Rgba8{0, 0, 0, 0});
  for (const Bitmap& b : partials) EXPECT_TRUE(merged.blendOver(b));
  EXPECT_TRUE(merged.pixels() == whole.pixels());

  Bitmap wrongSize(3, 3);
  EXPECT_FALSE(merged.blendOver(wrongSize));
}

// -------------------------------------------------------------------------------------------------
// Compositor and render pipeline
// -------------------------------------------------------------------------------------------------

static Bitmap Solid(int w, int h, Rgba8 c) { return Bitmap(w, h, c); }

static void TestCompositorDoubleBuffering()
{
  FrameCompositor comp(Rgba8{0, 0, 0, 255});
  EXPECT_EQ(comp.frontIndex(), 0);
  EXPECT_FALSE(comp.composite());

  const Rgba8 red{255, 0, 0, 255};
  const Rgba8 blue{0, 0, 255, 255};

  comp.begin(1, 2, 4, 4);
  EXPECT_TRUE(comp.accept(1, 0, Solid(4, 4, red)) == FrameCompositor::Accept::Stored);
  EXPECT_FALSE(comp.complete());
  EXPECT_TRUE(comp.accept(1, 0, Solid(4, 4, red)) == FrameCompositor::Accept::Duplicate);
  EXPECT_TRUE(comp.accept(1, 5, Solid(4, 4, red)) == FrameCompositor::Accept::Invalid);
  EXPECT_TRUE(comp.accept(1, 1, Solid(3, 4, red)) == FrameCompositor::Accept::Invalid);
  EXPECT_TRUE(comp.accept(9, 1, Solid(4, 4, red)) == FrameCompositor::Accept::Stale);
  EXPECT_TRUE(comp.accept(1, 1, Bitmap(4, 4)) == FrameCompositor::Accept::Stored);
  EXPECT_TRUE(comp.complete());

  const int front0 = comp.frontIndex();
  ASSERT_TRUE(comp.composite());
  EXPECT_EQ(comp.frontIndex(), 1 - front0);
  EXPECT_EQ(comp.presentedGeneration(), 1u);
  EXPECT_TRUE(comp.front().at(0, 0) == red);
  EXPECT_FALSE(comp.collecting());
  EXPECT_TRUE(comp.accept(1, 1, Solid(4, 4, red)) == FrameCompositor::Accept::Stale);

  comp.begin(2, 1, 4, 4);
  EXPECT_TRUE(comp.accept(2, 0, Solid(4, 4, blue)) == FrameCompositor::Accept::Stored);
  ASSERT_TRUE(comp.composite());
  EXPECT_EQ(comp.frontIndex(), front0);
  EXPECT_TRUE(comp.front().at(3, 3) == blue);
  // The previously visible frame is now the hidden one.
  EXPECT_TRUE(comp.hidden().at(3, 3) == red);
  EXPECT_EQ(comp.flips(), 2u);

  // Transparent partial pixels show the background.
  comp.begin(3, 1, 2, 2);
  EXPECT_TRUE(comp.accept(3, 0, Bitmap(2, 2)) == FrameCompositor::Accept::Stored);
  ASSERT_TRUE(comp.composite());
  EXPECT_TRUE(comp.front().at(1, 1) == (Rgba8{0, 0, 0, 255}));

  comp.begin(4, 2, 2, 2);
  comp.markFailed(4, 1);
  EXPECT_EQ(comp.failed(), 1);
  comp.abandon();
  EXPECT_EQ(comp.presentedGeneration(), 3u);
}

static void TestWorkerCounts()
{
  EXPECT_EQ(ComputeRenderWorkerCount(0), 1);
  EXPECT_EQ(ComputeRenderWorkerCount(1), 1);
  EXPECT_EQ(ComputeRenderWorkerCount(3), 3);
  EXPECT_EQ(ComputeRenderWorkerCount(4), 3);
  EXPECT_EQ(ComputeRenderWorkerCount(16), 15);
  EXPECT_EQ(ComputeAnalysisWorkerCount(0), 1);
  EXPECT_EQ(ComputeAnalysisWorkerCount(1), 1);
  EXPECT_EQ(ComputeAnalysisWorkerCount(8), 4);
}

struct RenderFixture {
  TileStore store{40};
  MetadataRegistry reg;
  RenderMetadataPtr meta;

  RenderFixture()
  {
    DemoWorldConfig dc;
    dc.seed = 11;
    dc.factions = 6;
    dc.players = 10;
    dc.minRadius = 3;
    dc.maxRadius = 8;
    DemoWorld demo(dc);
    demo.seed(store, reg);
    for (int i = 0; i < 5; ++i) store.writeBatch(demo.step(store, 100));
    meta = reg.snapshot(store);
  }

  FrameRequest request(const FrameGeometry& g, const RenderTheme& theme) const
  {
    FrameRequest r;
    r.geom = g;
    r.theme = theme;
    r.meta = meta;
    r.reader = store.reader();
    return r;
  }
};

static Bitmap RenderWith(const RenderFixture& fx, const FrameGeometry& g, const RenderTheme& theme, bool single,
                         int workers)
{
  RenderPipelineConfig cfg;
  cfg.workerCount = workers;
  cfg.forceSingleThreaded = single;
  cfg.minIntervalMs = 0;

  RenderPipeline p(cfg);
  p.start();
  EXPECT_EQ(p.parallel(), !single);
  p.requestRender(fx.request(g, theme));
  const std::uint64_t gen = p.tick(RenderPipeline::Clock::now());
  EXPECT_EQ(gen, 1u);
  EXPECT_TRUE(p.waitForGeneration(gen, std::chrono::seconds(20)));
  Bitmap out = p.frontSurface();
  p.shutdown();
  return out;
}

static void TestFallbackMatchesParallelOutput()
{
  const RenderFixture fx;

  const FrameGeometry geoms[] = {Geometry(160, 120, 20.0f, 20.0f, 0.37f), Geometry(150, 110, 10.3f, 12.7f, 2.5f),
                                 Geometry(97, 61, 35.0f, 4.0f, 1.13f)};
  RenderTheme themes[3];
  themes[0].showSeams = true;
  themes[1].mode = ColorMode::Player;
  themes[2].mode = ColorMode::Overpaint;
  themes[2].highlightCoreOnly = true;

  for (int i = 0; i < 3; ++i) {
    const Bitmap single = RenderWith(fx, geoms[i], themes[i], true, 0);
    const Bitmap parallel = RenderWith(fx, geoms[i], themes[i], false, 3);
    EXPECT_EQ(single.width(), geoms[i].width);
    EXPECT_EQ(single.height(), geoms[i].height);
    EXPECT_EQ(single.coveredPixels(), static_cast<std::size_t>(geoms[i].width * geoms[i].height));
    EXPECT_TRUE(single.pixels() == parallel.pixels());
  }

  // The frame is not just background.
  const Bitmap img = RenderWith(fx, geoms[0], themes[0], true, 0);
  bool sawNonBlack = false;
  for (int y = 0; y < img.height() && !sawNonBlack; ++y)
    for (int x = 0; x < img.width(); ++x)
      if (!(img.at(x, y) == (Rgba8{0, 0, 0, 255}))) sawNonBlack = true;
  EXPECT_TRUE(sawNonBlack);
}

static void TestOnlyNewestGenerationIsPresented()
{
  const RenderFixture fx;

  RenderPipelineConfig cfg;
  cfg.workerCount = 3;
  cfg.minIntervalMs = 0;
  RenderPipeline p(cfg);
  ASSERT_TRUE(p.start());
  EXPECT_EQ(p.partitions(), 3);

  RenderTheme theme;
  const auto t0 = RenderPipeline::Clock::now();
  p.requestRender(fx.request(Geometry(120, 80, 20.0f, 20.0f, 0.5f), theme));
  const std::uint64_t g = p.tick(t0);
  p.requestRender(fx.request(Geometry(130, 90, 20.0f, 20.0f, 0.5f), theme));
  const std::uint64_t g1 = p.tick(t0 + std::chrono::milliseconds(20));
  EXPECT_EQ(g1, g + 1);

  ASSERT_TRUE(p.waitForGeneration(g1, std::chrono::seconds(20)));
  EXPECT_EQ(p.presentedGeneration(), g1);
  EXPECT_EQ(p.stats().framesPresented, 1u);
  EXPECT_EQ(p.frontSurface().width(), 130);

  // Every partial of the older generation ends up discarded.
  EXPECT_TRUE(p.waitWorkersIdle(std::chrono::seconds(20)));
  p.pump(RenderPipeline::Clock::now());
  EXPECT_EQ(p.stats().stalePartialsDropped, 3u);
  EXPECT_EQ(p.stats().framesPresented, 1u);
  EXPECT_EQ(p.presentedGeneration(), g1);
  p.shutdown();
}

static void TestThrottleCoalescesRequests()
{
  const RenderFixture fx;

  RenderPipelineConfig cfg;
  cfg.forceSingleThreaded = true;
  cfg.minIntervalMs = 16;
  RenderPipeline p(cfg);
  EXPECT_FALSE(p.start());
  EXPECT_EQ(p.partitions(), 1);

  RenderTheme theme;
  const auto t0 = RenderPipeline::Clock::now();
  EXPECT_EQ(p.tick(t0), 0u);

  p.requestRender(fx.request(Geometry(40, 40, 20.0f, 20.0f, 0.5f), theme));
  EXPECT_EQ(p.tick(t0), 1u);
  EXPECT_EQ(p.presentedGeneration(), 1u);

  p.requestRender(fx.request(Geometry(50, 40, 20.0f, 20.0f, 0.5f), theme));
  p.requestRender(fx.request(Geometry(60, 40, 20.0f, 20.0f, 0.5f), theme));
  EXPECT_EQ(p.stats().coalescedRequests, 1u);

  EXPECT_EQ(p.tick(t0 + std::chrono::milliseconds(5)), 0u);
  EXPECT_TRUE(p.hasPendingRequest());
  EXPECT_EQ(p.tick(t0 + std::chrono::milliseconds(16)), 2u);
  EXPECT_FALSE(p.hasPendingRequest());

  // The latest request won.
  EXPECT_EQ(p.presentedGeneration(), 2u);
  EXPECT_EQ(p.frontSurface().width(), 60);
  EXPECT_EQ(p.stats().generationsDispatched, 2u);
  EXPECT_EQ(p.stats().fallbackFrames, 2u);
}

static void TestWorkerFailureIsReported()
{
  const RenderFixture fx;
  RenderTheme theme;

  RenderPipelineConfig cfg;
  cfg.workerCount = 2;
  cfg.minIntervalMs = 0;
  RenderPipeline p(cfg);
  ASSERT_TRUE(p.start());

  p.setRasterHook([](std::uint64_t, int partition) {
    if (partition == 1) throw std::runtime_error("injected raster failure");
  });
  p.requestRender(fx.request(Geometry(64, 64, 20.0f, 20.0f, 0.5f), theme));
  const std::uint64_t g = p.tick(RenderPipeline::Clock::now());
  ASSERT_TRUE(g != 0u);

  EXPECT_TRUE(p.waitWorkersIdle(std::chrono::seconds(20)));
  p.pump(RenderPipeline::Clock::now());
  EXPECT_EQ(p.stats().failures, 1u);
  EXPECT_EQ(p.stats().framesPresented, 0u);
  EXPECT_EQ(p.presentedGeneration(), 0u);

  // The next generation renders normally.
  p.setRasterHook(RenderPipeline::RasterHook());
  p.requestRender(fx.request(Geometry(64, 64, 20.0f, 20.0f, 0.5f), theme));
  const std::uint64_t g2 = p.tick(RenderPipeline::Clock::now());
  EXPECT_TRUE(p.waitForGeneration(g2, std::chrono::seconds(20)));
  EXPECT_EQ(p.presentedGeneration(), g2);
  p.shutdown();

  // Same in the single-threaded path.
  RenderPipelineConfig scfg;
  scfg.forceSingleThreaded = true;
  RenderPipeline s(scfg);
  s.start();
  s.setRasterHook([](std::uint64_t, int) { throw std::runtime_error("injected"); });
  s.requestRender(fx.request(Geometry(32, 32, 20.0f, 20.0f, 0.5f), theme));
  EXPECT_EQ(s.tick(RenderPipeline::Clock::now()), 1u);
  EXPECT_EQ(s.stats().failures, 1u);
  EXPECT_EQ(s.presentedGeneration(), 0u);
}

static void TestNonStandardThrowsAreReported()
{
  const RenderFixture fx;
  RenderTheme theme;

  RenderPipelineConfig cfg;
  cfg.workerCount = 2;
  cfg.minIntervalMs = 0;
  RenderPipeline p(cfg);
  ASSERT_TRUE(p.start());
  p.setRasterHook([](std::uint64_t, int partition) {
    if (partition == 0) throw 7;
  });
  p.requestRender(fx.request(Geometry(48, 48, 20.0f, 20.0f, 0.5f), theme));
  ASSERT_TRUE(p.tick(RenderPipeline::Clock::now()) != 0u);
  EXPECT_TRUE(p.waitWorkersIdle(std::chrono::seconds(20)));

  std::ostringstream captured;
  std::streambuf* saved = std::cerr.rdbuf(captured.rdbuf());
  p.pump(RenderPipeline::Clock::now());
  std::cerr.rdbuf(saved);

  EXPECT_EQ(p.stats().failures, 1u);
  EXPECT_TRUE(captured.str().find("partition 0 failed: unknown error") != std::string::npos);

  // The pool is still serving: the next frame presents.
  p.setRasterHook(RenderPipeline::RasterHook());
  p.requestRender(fx.request(Geometry(48, 48, 20.0f, 20.0f, 0.5f), theme));
  const std::uint64_t g = p.tick(RenderPipeline::Clock::now());
  EXPECT_TRUE(p.waitForGeneration(g, std::chrono::seconds(20)));
  p.shutdown();

  // Single-threaded rasterizer.
  RenderPipelineConfig scfg;
  scfg.forceSingleThreaded = true;
  RenderPipeline s(scfg);
  s.start();
  s.setRasterHook([](std::uint64_t, int) { throw std::string("not an exception"); });
  s.requestRender(fx.request(Geometry(32, 32, 20.0f, 20.0f, 0.5f), theme));
  EXPECT_EQ(s.tick(RenderPipeline::Clock::now()), 1u);
  EXPECT_EQ(s.stats().failures, 1u);

  // Analysis workers.
  AnalysisServiceConfig acfg;
  acfg.workerCount = 1;
  AnalysisService svc(acfg);
  EXPECT_TRUE(svc.start());
  svc.setAnalyzer([](const TileReader&, std::uint16_t) -> FactionAnalysis { throw 42; });
  const AnalysisFuture f = svc.query(fx.store.reader(), 0);
  ASSERT_TRUE(svc.waitFor(f, std::chrono::seconds(10)));
  EXPECT_FALSE(f.get()->ok);
  EXPECT_EQ(f.get()->error, std::string("unknown error"));
  svc.shutdown();

  // A bare pool task.
  WorkerPool pool("test-pool");
  std::string err;
  ASSERT_TRUE(pool.start(1, err));
  std::atomic<int> ran{0};
  std::streambuf* savedPool = std::cerr.rdbuf(captured.rdbuf());
  EXPECT_TRUE(pool.submit([]() { throw 3; }));
  EXPECT_TRUE(pool.submit([&ran]() { ran.fetch_add(1); }));
  EXPECT_TRUE(pool.waitIdle(std::chrono::seconds(10)));
  std::cerr.rdbuf(savedPool);
  EXPECT_EQ(ran.load(), 1);
  pool.stop();
}

// The coordinator keeps painting while render partitions, analyses and a raw
// reader thread look at the same region.
static void TestWritesWhileWorkersRead()
{
  RenderFixture fx;
  const int n = fx.store.gridSize();
  const std::uint16_t tide = *fx.store.internFaction("tide");
  ASSERT_TRUE(fx.store.internFaction("ebb").has_value());
  fx.meta = fx.reg.snapshot(fx.store);
  const std::size_t knownFactions = fx.store.factions().size();

  RenderTheme theme;
  theme.showSeams = true;
  const FrameGeometry geom = Geometry(128, 128, 20.0f, 20.0f, 0.2f);

  RenderPipelineConfig rcfg;
  rcfg.workerCount = 3;
  rcfg.minIntervalMs = 0;
  RenderPipeline render(rcfg);
  ASSERT_TRUE(render.start());

  AnalysisServiceConfig acfg;
  acfg.workerCount = 2;
  AnalysisService analysis(acfg);
  ASSERT_TRUE(analysis.start());

  std::atomic<bool> stop{false};
  std::atomic<int> badIndices{0};
  std::atomic<int> sweeps{0};
  const TileReader sweepReader = fx.store.reader();
  std::thread sweeper([&]() {
    while (!stop.load()) {
      for (int y = 0; y < n; ++y) {
        for (int x = 0; x < n; ++x) {
          const std::uint16_t fi = sweepReader.factionIndexAt(x, y);
          if (fi != kNoFaction && fi >= knownFactions) badIndices.fetch_add(1);
        }
      }
      sweeps.fetch_add(1);
    }
  });

  std::vector<AnalysisFuture> futures;
  std::uint64_t lastVersion = fx.store.version();
  for (int round = 0; round < 150; ++round) {
    render.requestRender(fx.request(geom, theme));
    render.tick(RenderPipeline::Clock::now());
    futures.push_back(analysis.query(fx.store.reader(), tide));

    std::vector<TileWrite> batch;
    for (int i = 0; i < n; ++i) {
      batch.push_back(Paint(i, (i + round) % n, (round % 2 == 0) ? "tide" : "ebb", 0x2040A0u + round));
    }
    EXPECT_EQ(fx.store.writeBatch(batch), static_cast<std::size_t>(n));
    EXPECT_TRUE(fx.store.write(Paint(round % n, n - 1 - round % n, "tide", 0x10A040u, round % 7 == 0)));
    if (round % 5 == 0) EXPECT_TRUE(fx.store.clear((round * 3) % n, round % n));

    EXPECT_TRUE(fx.store.version() > lastVersion);
    lastVersion = fx.store.version();

    render.pump(RenderPipeline::Clock::now());
    analysis.pump();
  }

  while (sweeps.load() == 0) std::this_thread::yield();
  stop.store(true);
  sweeper.join();
  EXPECT_EQ(badIndices.load(), 0);

  for (const AnalysisFuture& f : futures) {
    ASSERT_TRUE(analysis.waitFor(f, std::chrono::seconds(20)));
    ASSERT_TRUE(f.get() != nullptr);
    EXPECT_TRUE(f.get()->ok);
  }
  EXPECT_TRUE(render.waitWorkersIdle(std::chrono::seconds(20)));
  render.pump(RenderPipeline::Clock::now());
  EXPECT_EQ(render.stats().failures, 0u);

  // Quiet store: fresh queries see exactly the final state.
  const TileReader finalReader = fx.store.reader();
  EXPECT_EQ(finalReader.version(), fx.store.version());

  const AnalysisFuture last = analysis.query(finalReader, tide);
  ASSERT_TRUE(analysis.waitFor(last, std::chrono::seconds(20)));
  const FactionAnalysisPtr a = last.get();
  ASSERT_TRUE(a != nullptr && a->ok);
  EXPECT_EQ(a->version, fx.store.version());
  EXPECT_EQ(static_cast<std::uint32_t>(a->tileCount), fx.store.countTilesByFaction()[tide]);
  const FactionAnalysis direct = AnalyzeFaction(finalReader, tide);
  EXPECT_EQ(a->tileCount, direct.tileCount);
  EXPECT_EQ(a->clusters.size(), direct.clusters.size());
  EXPECT_EQ(a->edges.size(), direct.edges.size());

  render.requestRender(fx.request(geom, theme));
  const std::uint64_t g = render.tick(RenderPipeline::Clock::now());
  ASSERT_TRUE(g != 0u);
  ASSERT_TRUE(render.waitForGeneration(g, std::chrono::seconds(20)));
  EXPECT_EQ(render.presentedGeneration(), g);
  const Bitmap expected = RenderWith(fx, geom, theme, true, 0);
  EXPECT_TRUE(render.frontSurface().pixels() == expected.pixels());

  render.shutdown();
  analysis.shutdown();
}

static void TestWatchdogPresentsPartialFrame()
{
  const RenderFixture fx;
  RenderTheme theme;

  RenderPipelineConfig cfg;
  cfg.workerCount = 2;
  cfg.minIntervalMs = 0;
  cfg.watchdogMs = 5;
  RenderPipeline p(cfg);
  ASSERT_TRUE(p.start());

  p.setRasterHook([](std::uint64_t, int partition) {
    if (partition == 1) throw std::runtime_error("injected raster failure");
  });
  p.requestRender(fx.request(Geometry(64, 64, 20.0f, 20.0f, 0.5f), theme));
  const auto t0 = RenderPipeline::Clock::now();
  const std::uint64_t g = p.tick(t0);
  ASSERT_TRUE(g != 0u);

  EXPECT_TRUE(p.waitWorkersIdle(std::chrono::seconds(20)));
  EXPECT_TRUE(p.pump(t0 + std::chrono::milliseconds(100)));
  EXPECT_EQ(p.presentedGeneration(), g);
  EXPECT_EQ(p.stats().watchdogComposites, 1u);
  EXPECT_EQ(p.stats().failures, 1u);

  // Rows of the failed partition show the background.
  const Bitmap& front = p.frontSurface();
  EXPECT_EQ(front.width(), 64);
  p.shutdown();
}

static void TestDemoWorldIsDeterministic()
{
  DemoWorldConfig dc;
  dc.seed = 5;
  dc.factions = 5;
  dc.players = 8;
  dc.minRadius = 2;
  dc.maxRadius = 6;

  TileStore a(40);
  TileStore b(40);
  MetadataRegistry ra;
  MetadataRegistry rb;
  DemoWorld da(dc);
  DemoWorld db(dc);
  da.seed(a, ra);
  db.seed(b, rb);
  EXPECT_TRUE(a.exportSnapshot().records == b.exportSnapshot().records);
  EXPECT_EQ(da.factionIds().size(), static_cast<std::size_t>(5));
  EXPECT_EQ(da.playerIds().size(), static_cast<std::size_t>(8));

  const std::vector<TileWrite> writes = da.step(a, 50);
  EXPECT_TRUE(writes.size() <= 50u);
  for (const TileWrite& w : writes) {
    const std::optional<TileRecord> r = a.read(w.x, w.y);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->isCore());
    EXPECT_TRUE(a.factions().find(w.factionId).has_value());
  }
  EXPECT_TRUE(db.step(b, 50).size() == writes.size());
}

int main()
{
  TestTileRecordByteLayout();
  TestStoreWriteReadRoundTrip();
  TestStoreOutOfRangeIsNoOp();
  TestInternTables();
  TestVersionMonotonicity();
  TestCountTilesByFaction();

  TestSnapshotCodec();
  TestFullReplaceRemapsIdentities();
  TestFullReplaceRejectsInvalidSnapshots();
  TestReaderKeepsOldRegionAcrossFullReplace();
  TestFullFactionTableSurvivesSnapshots();
  TestRejectedReplaceInternsNothing();

  TestClusterConnectivity();
  TestPrimaryClusterPrefersCore();
  TestSingleTileHasFourEdges();
  TestWorkedExampleOnFourByFour();
  TestMergeBorderEdges();
  TestFindBorderTiles();
  TestFactionLabels();

  TestAnalysisCacheReturnsIdenticalResult();
  TestAnalysisOnWorkerPool();
  TestAnalysisFailureKeepsLastGoodResult();
  TestAnalysisCacheEviction();

  TestHexColors();
  TestColorRuleModes();
  TestMetadataSnapshotsRebuildOnlyOnChange();
  TestViewportMapping();
  TestRasterPartitionsAreDisjoint();

  TestCompositorDoubleBuffering();
  TestWorkerCounts();
  TestFallbackMatchesParallelOutput();
  TestOnlyNewestGenerationIsPresented();
  TestThrottleCoalescesRequests();
  TestWorkerFailureIsReported();
  TestWatchdogPresentsPartialFrame();
  TestNonStandardThrowsAreReported();
  TestWritesWhileWorkersRead();
  TestDemoWorldIsDeterministic();

  if (g_failures == 0) {
    std::cout << "faction_atlas_tests: OK\n";
    return 0;
  }

  std::cerr << "faction_atlas_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
