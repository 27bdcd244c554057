#include <QFileInfo>
#include <QtTest>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "TestGrids.h"
#include "mdv/Errors.h"
#include "mdv/FramePrefetcher.h"

namespace {

QStringList FakeFiles(int count) {
  QStringList files;
  for (int i = 0; i < count; ++i) {
    files << QString("/data/step%1.vts").arg(i);
  }
  return files;
}

// In-memory loader that counts reads per path and fails on request.
class CountingLoader {
 public:
  explicit CountingLoader(QStringList failing = {})
      : failing_(std::move(failing)) {}

  mdv::FrameLoader loader() {
    return [this](const QString& path) -> mdv::GridFramePtr {
      {
        std::lock_guard<std::mutex> lock(m_);
        ++reads_[path];
      }
      if (failing_.contains(QFileInfo(path).fileName())) {
        throw mdv::LoadError(path, "malformed");
      }
      return std::make_shared<mdv::GridFrame>(
          path, mdv::testing::MakeBoxGrid(2, 2, 2));
    };
  }

  int reads(const QString& path) const {
    std::lock_guard<std::mutex> lock(m_);
    auto it = reads_.find(path);
    return it == reads_.end() ? 0 : it->second;
  }

 private:
  QStringList failing_;
  mutable std::mutex m_;
  std::map<QString, int> reads_;
};

std::optional<mdv::PrefetchedFrame> PopWithin(mdv::PlaybackState& state,
                                              int timeout_ms) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto item = state.queue().try_pop()) {
      return item;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return std::nullopt;
}

}  // namespace

class FramePrefetcherTest : public QObject {
  Q_OBJECT

 private slots:
  void claim_index_rejects_duplicates();
  void delivers_frames_in_order();
  void never_loads_claimed_index_twice();
  void skips_frames_that_fail_to_load();
  void stop_releases_blocked_worker();
};

void FramePrefetcherTest::claim_index_rejects_duplicates() {
  mdv::PlaybackState state;
  QVERIFY(state.claim_index(3));
  QVERIFY(!state.claim_index(3));
  QVERIFY(state.is_claimed(3));
  QVERIFY(!state.is_claimed(4));
  QCOMPARE(state.claimed_count(), std::size_t(1));
  QCOMPARE(state.queue().capacity(), mdv::PlaybackState::kQueueCapacity);
}

void FramePrefetcherTest::delivers_frames_in_order() {
  const QStringList files = FakeFiles(6);
  CountingLoader counter;
  auto state = std::make_shared<mdv::PlaybackState>();
  mdv::FramePrefetcher prefetcher(state, files, counter.loader());
  prefetcher.start(1);

  for (int expected = 1; expected < files.size(); ++expected) {
    const auto item = PopWithin(*state, 2000);
    QVERIFY(item.has_value());
    QCOMPARE(item->index, expected);
    QCOMPARE(item->frame->path(), files[expected]);
    QVERIFY(state->queue().size() <= mdv::PlaybackState::kQueueCapacity);
  }
  QTRY_VERIFY(state->producer_finished());
  QCOMPARE(counter.reads(files[0]), 0);
}

void FramePrefetcherTest::never_loads_claimed_index_twice() {
  const QStringList files = FakeFiles(4);
  CountingLoader counter;
  auto state = std::make_shared<mdv::PlaybackState>();
  // Index 2 is already taken by the consumer.
  QVERIFY(state->claim_index(2));
  mdv::FramePrefetcher prefetcher(state, files, counter.loader());
  prefetcher.start(0);

  QList<int> seen;
  while (seen.size() < 3) {
    const auto item = PopWithin(*state, 2000);
    QVERIFY(item.has_value());
    seen << item->index;
  }
  QCOMPARE(seen, QList<int>({0, 1, 3}));
  QTRY_VERIFY(state->producer_finished());
  for (const auto& f : files) {
    QVERIFY(counter.reads(f) <= 1);
  }
  QCOMPARE(counter.reads(files[2]), 0);
}

void FramePrefetcherTest::skips_frames_that_fail_to_load() {
  const QStringList files = FakeFiles(5);
  CountingLoader counter({"step2.vts", "step3.vts"});
  auto state = std::make_shared<mdv::PlaybackState>();
  mdv::FramePrefetcher prefetcher(state, files, counter.loader());
  prefetcher.start(1);

  auto first = PopWithin(*state, 2000);
  QVERIFY(first.has_value());
  QCOMPARE(first->index, 1);
  auto second = PopWithin(*state, 2000);
  QVERIFY(second.has_value());
  QCOMPARE(second->index, 4);
  QTRY_VERIFY(state->producer_finished());
  QCOMPARE(counter.reads(files[2]), 1);
  QCOMPARE(counter.reads(files[3]), 1);
}

void FramePrefetcherTest::stop_releases_blocked_worker() {
  const QStringList files = FakeFiles(20);
  CountingLoader counter;
  auto state = std::make_shared<mdv::PlaybackState>();
  {
    mdv::FramePrefetcher prefetcher(state, files, counter.loader());
    prefetcher.start(0);
    QTRY_COMPARE(state->queue().size(), mdv::PlaybackState::kQueueCapacity);
    prefetcher.stop();
    QVERIFY(state->stop_requested());
  }
  // The destructor joined the worker.
  QVERIFY(state->producer_finished());
  QVERIFY(state->claimed_count() < std::size_t(files.size()));
}

QTEST_GUILESS_MAIN(FramePrefetcherTest)
#include "tst_frame_prefetcher.moc"
