#include <QtTest>

#include <atomic>
#include <chrono>
#include <thread>

#include "mdv/FrameQueue.h"

class FrameQueueTest : public QObject {
  Q_OBJECT

 private slots:
  void fifo_order();
  void pop_on_empty_returns_nothing();
  void push_blocks_until_consumer_pops();
  void close_releases_blocked_producer();
  void clear_discards_items();
};

void FrameQueueTest::fifo_order() {
  mdv::BoundedQueue<int> queue(2);
  QCOMPARE(queue.capacity(), std::size_t(2));
  QVERIFY(queue.push(1));
  QVERIFY(queue.push(2));
  QCOMPARE(queue.size(), std::size_t(2));
  QCOMPARE(queue.try_pop().value(), 1);
  QCOMPARE(queue.try_pop().value(), 2);
  QVERIFY(queue.empty());
}

void FrameQueueTest::pop_on_empty_returns_nothing() {
  mdv::BoundedQueue<int> queue(2);
  QVERIFY(!queue.try_pop().has_value());
}

void FrameQueueTest::push_blocks_until_consumer_pops() {
  mdv::BoundedQueue<int> queue(2);
  QVERIFY(queue.push(1));
  QVERIFY(queue.push(2));

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    pushed = queue.push(3);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  QVERIFY(!pushed.load());
  QCOMPARE(queue.size(), std::size_t(2));

  QCOMPARE(queue.try_pop().value(), 1);
  producer.join();
  QVERIFY(pushed.load());
  QCOMPARE(queue.size(), std::size_t(2));
  QCOMPARE(queue.try_pop().value(), 2);
  QCOMPARE(queue.try_pop().value(), 3);
}

void FrameQueueTest::close_releases_blocked_producer() {
  mdv::BoundedQueue<int> queue(1);
  QVERIFY(queue.push(1));

  std::atomic<bool> finished{false};
  std::atomic<bool> result{true};
  std::thread producer([&]() {
    result = queue.push(2);
    finished = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  QVERIFY(!finished.load());
  queue.close();
  producer.join();
  QVERIFY(finished.load());
  QVERIFY(!result.load());
  QVERIFY(queue.closed());
  QVERIFY(!queue.push(3));
}

void FrameQueueTest::clear_discards_items() {
  mdv::BoundedQueue<int> queue(2);
  QVERIFY(queue.push(1));
  QVERIFY(queue.push(2));
  queue.clear();
  QVERIFY(queue.empty());
  QVERIFY(queue.push(3));
}

QTEST_GUILESS_MAIN(FrameQueueTest)
#include "tst_frame_queue.moc"
