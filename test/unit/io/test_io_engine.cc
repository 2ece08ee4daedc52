/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mocks/mock_transport.hpp"
#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"
#include "serialtrack/io/io_engine.hpp"
#include "utils/test_utils.hpp"

using namespace serialtrack;
using namespace serialtrack::io;
using namespace std::chrono_literals;
using serialtrack::diagnostics::IoClosedException;
using serialtrack::diagnostics::IoException;
using serialtrack::test::TestUtils;
using serialtrack::test::mocks::FakeSerialTransport;
namespace errc = boost::system::errc;

namespace {

std::string to_string(const Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); }

/**
 * @brief Transport whose modem-status query takes a while to answer
 */
class SlowSignalTransport : public FakeSerialTransport {
 public:
  transport::SerialSignals get_signals(boost::system::error_code& ec) override {
    in_call.store(true);
    std::this_thread::sleep_for(300ms);
    if (!is_open()) {
      closed_during_call.store(true);
    }
    in_call.store(false);
    return FakeSerialTransport::get_signals(ec);
  }

  void close(boost::system::error_code& ec) override {
    if (in_call.load()) {
      closed_during_call.store(true);
    }
    FakeSerialTransport::close(ec);
  }

  std::atomic<bool> in_call{false};
  std::atomic<bool> closed_during_call{false};
};

}  // namespace

/**
 * @brief Engine over an in-memory transport with its own single-threaded executor
 */
class IoEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    work_guard_ = std::make_unique<WorkGuard>(ioc_.get_executor());
    ioc_thread_ = std::thread([this]() { ioc_.run(); });
    diagnostics::ErrorHandler::instance().reset_stats();
  }

  void TearDown() override {
    if (engine_) {
      engine_->close();
      engine_.reset();
    }
    work_guard_.reset();
    ioc_.stop();
    if (ioc_thread_.joinable()) {
      ioc_thread_.join();
    }
    diagnostics::ErrorHandler::instance().reset_stats();
  }

  void start_engine(size_t write_chunk = 256) {
    auto transport = std::make_unique<FakeSerialTransport>();
    fake_ = transport.get();
    config::ConnectionConfig cfg;
    cfg.write_chunk = write_chunk;
    engine_ = IoEngine::create(std::move(transport), cfg, ioc_.get_executor());
    engine_->start();
  }

  std::string read_exactly(size_t size, std::chrono::milliseconds timeout = 2s) {
    std::string out;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < size && std::chrono::steady_clock::now() < deadline) {
      out += to_string(engine_->read_sync(util::timeout_of(50ms), size - out.size()));
    }
    return out;
  }

  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::thread ioc_thread_;
  std::shared_ptr<IoEngine> engine_;
  FakeSerialTransport* fake_ = nullptr;
};

TEST_F(IoEngineTest, CreateRequiresTransport) {
  EXPECT_THROW(IoEngine::create(nullptr, config::ConnectionConfig{}, ioc_.get_executor()), std::invalid_argument);
}

TEST_F(IoEngineTest, ReadReturnsReceivedBytes) {
  start_engine();

  // When
  fake_->feed("hello");

  // Then
  EXPECT_EQ(read_exactly(5), "hello");
  EXPECT_EQ(engine_->incoming_size(), 0u);
}

TEST_F(IoEngineTest, ReadTimesOutEmpty) {
  start_engine();

  auto start = std::chrono::steady_clock::now();
  Bytes data = engine_->read_sync(util::timeout_of(100ms));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(data.empty());
  EXPECT_GE(elapsed, 100ms);
  EXPECT_LT(elapsed, 1s);

  // Zero timeout checks once
  EXPECT_TRUE(engine_->read_sync(util::Clock::duration::zero()).empty());
}

TEST_F(IoEngineTest, ReadHonorsMaxBytes) {
  start_engine();
  fake_->feed("abcdef");
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->incoming_size() == 6; }));

  EXPECT_EQ(to_string(engine_->read_sync(std::nullopt, 2)), "ab");
  EXPECT_EQ(to_string(engine_->read_sync(std::nullopt, 3)), "cde");
  EXPECT_EQ(to_string(engine_->read_sync()), "f");
}

TEST_F(IoEngineTest, WritesGoOutInChunks) {
  start_engine(4);

  // When
  engine_->write(std::string_view("0123456789"));

  // Then
  EXPECT_TRUE(engine_->drain_sync(util::timeout_of(2s)));
  EXPECT_EQ(fake_->output(), "0123456789");
  EXPECT_LE(fake_->max_write_size(), 4u);
  EXPECT_GE(fake_->write_calls(), 3u);
  EXPECT_EQ(engine_->outgoing_size(), 0u);
}

TEST_F(IoEngineTest, WriteOverloads) {
  start_engine();

  const uint8_t raw[] = {'a', 'b'};
  engine_->write(raw, sizeof(raw));
  engine_->write(Bytes{'c'});
  engine_->write(std::string_view("d"));

  ASSERT_TRUE(engine_->drain_sync(util::timeout_of(2s)));
  EXPECT_EQ(fake_->output(), "abcd");
}

TEST_F(IoEngineTest, DrainWaitsForSlowLine) {
  start_engine(4);
  fake_->hold_writes(true);

  // Given: twelve bytes queued on a stalled line
  engine_->write(std::string_view("AAAABBBBCCCC"));

  // Then
  EXPECT_FALSE(engine_->drain_sync(util::timeout_of(100ms)));
  EXPECT_FALSE(engine_->drain_sync(util::Clock::duration::zero(), 4));
  EXPECT_TRUE(engine_->drain_sync(util::Clock::duration::zero(), 12));

  // When the line resumes
  fake_->hold_writes(false);
  EXPECT_TRUE(engine_->drain_sync(util::timeout_of(2s)));
  EXPECT_EQ(fake_->output(), "AAAABBBBCCCC");
}

TEST_F(IoEngineTest, ReadFaultIsSticky) {
  start_engine();

  fake_->fail_reads(errc::make_error_code(errc::io_error));

  EXPECT_THROW(engine_->read_sync(util::timeout_of(2s)), IoException);
  EXPECT_THROW(engine_->read_sync(util::Clock::duration::zero()), IoException);
  EXPECT_THROW(engine_->write(std::string_view("x")), IoException);
  EXPECT_THROW(engine_->drain_sync(), IoException);
  EXPECT_FALSE(engine_->is_closed());

  // The first fault was reported once
  EXPECT_EQ(diagnostics::ErrorHandler::instance().get_errors_by_component("engine").size(), 1u);
}

TEST_F(IoEngineTest, DataBeforeFaultIsDelivered) {
  start_engine();

  // Given
  fake_->feed("last words");
  fake_->fail_reads(errc::make_error_code(errc::io_error));
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->fault() != nullptr; }));

  // Then
  EXPECT_EQ(to_string(engine_->read_sync()), "last words");
  try {
    engine_->read_sync();
    FAIL() << "expected IoException";
  } catch (const IoException& e) {
    EXPECT_EQ(e.get_operation(), "read");
    EXPECT_EQ(e.get_port(), "/dev/ttyFAKE0");
    EXPECT_EQ(e.code(), errc::make_error_code(errc::io_error));
  }
}

TEST_F(IoEngineTest, EndOfFileIsAFault) {
  auto transport = std::make_unique<FakeSerialTransport>();
  fake_ = transport.get();
  engine_ = IoEngine::create(std::move(transport), config::ConnectionConfig{}, ioc_.get_executor());
  engine_->start();

  fake_->fail_reads(boost::asio::error::eof);

  EXPECT_THROW(engine_->read_sync(util::timeout_of(2s)), IoException);
}

TEST_F(IoEngineTest, WriteFaultIsSticky) {
  start_engine();

  fake_->fail_writes(errc::make_error_code(errc::broken_pipe));
  engine_->write(std::string_view("doomed"));

  EXPECT_THROW(engine_->drain_sync(util::timeout_of(2s)), IoException);
  EXPECT_THROW(engine_->write(std::string_view("more")), IoException);
  // Empty write is the cheap health probe
  EXPECT_THROW(engine_->write(Bytes{}), IoException);
}

TEST_F(IoEngineTest, EmptyWriteOnHealthyEngine) {
  start_engine();

  EXPECT_NO_THROW(engine_->write(Bytes{}));
  EXPECT_EQ(engine_->outgoing_size(), 0u);
}

TEST_F(IoEngineTest, CloseIsTerminal) {
  start_engine();
  fake_->hold_writes(true);
  fake_->feed("unread");
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->incoming_size() == 6; }));
  engine_->write(std::string_view("unsent"));

  // When
  engine_->close();

  // Then: buffers are discarded and every operation fails
  EXPECT_TRUE(engine_->is_closed());
  EXPECT_TRUE(fake_->cancelled());
  EXPECT_EQ(engine_->incoming_size(), 0u);
  EXPECT_EQ(engine_->outgoing_size(), 0u);
  EXPECT_THROW(engine_->read_sync(), IoClosedException);
  EXPECT_THROW(engine_->write(std::string_view("x")), IoClosedException);
  EXPECT_THROW(engine_->write(Bytes{}), IoClosedException);
  EXPECT_THROW(engine_->drain_sync(), IoClosedException);
  EXPECT_THROW(engine_->get_signals(), IoClosedException);
  EXPECT_THROW(engine_->set_signals(true, std::nullopt, std::nullopt), IoClosedException);

  // Idempotent, and the transport is only closed on request
  EXPECT_NO_THROW(engine_->close());
  EXPECT_TRUE(fake_->is_open());
  engine_->close_transport();
  EXPECT_FALSE(fake_->is_open());
}

TEST_F(IoEngineTest, CloseWakesBlockedCallers) {
  start_engine();
  fake_->hold_writes(true);
  engine_->write(std::string_view("stuck"));

  auto reader = std::async(std::launch::async, [this]() { return engine_->read_sync(); });
  auto drainer = std::async(std::launch::async, [this]() { return engine_->drain_sync(); });
  TestUtils::waitFor(50);

  engine_->close();

  ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(drainer.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(reader.get(), IoClosedException);
  EXPECT_THROW(drainer.get(), IoClosedException);
}

TEST_F(IoEngineTest, CloseKeepsEarlierFaultAsCause) {
  start_engine();
  fake_->fail_reads(errc::make_error_code(errc::io_error));
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->fault() != nullptr; }));

  engine_->close();

  try {
    engine_->read_sync();
    FAIL() << "expected IoClosedException";
  } catch (const IoClosedException& e) {
    ASSERT_TRUE(e.cause());
    EXPECT_THROW(std::rethrow_exception(e.cause()), IoException);
  }
}

TEST_F(IoEngineTest, ConcurrentReadersGetDisjointData) {
  start_engine();

  std::string sent;
  for (int i = 0; i < 2000; ++i) {
    sent.push_back(static_cast<char>(i % 251));
  }

  std::atomic<size_t> total{0};
  auto reader = [this, &total]() {
    std::string got;
    while (total.load() < 2000) {
      auto data = engine_->read_sync(util::timeout_of(20ms), 7);
      got += to_string(data);
      total += data.size();
    }
    return got;
  };
  auto a = std::async(std::launch::async, reader);
  auto b = std::async(std::launch::async, reader);

  for (size_t pos = 0; pos < sent.size(); pos += 100) {
    fake_->feed(sent.substr(pos, 100));
  }

  std::string merged = a.get() + b.get();
  EXPECT_EQ(merged.size(), sent.size());
  std::sort(merged.begin(), merged.end());
  std::sort(sent.begin(), sent.end());
  EXPECT_EQ(merged, sent);
}

TEST_F(IoEngineTest, ConcurrentWritesAreNotInterleaved) {
  start_engine(3);

  auto writer = [this](char c) {
    const std::string block(10, c);
    for (int i = 0; i < 100; ++i) {
      engine_->write(std::string_view(block));
    }
  };
  std::thread a(writer, 'A');
  std::thread b(writer, 'B');
  a.join();
  b.join();

  ASSERT_TRUE(engine_->drain_sync(util::timeout_of(5s)));
  std::string out = fake_->output();
  ASSERT_EQ(out.size(), 2000u);
  for (size_t pos = 0; pos < out.size(); pos += 10) {
    EXPECT_EQ(out.substr(pos, 10), std::string(10, out[pos])) << "at " << pos;
  }
}

TEST_F(IoEngineTest, ControlSignals) {
  start_engine();
  fake_->set_input_signals(true, false);

  engine_->set_signals(true, false, std::nullopt);
  auto signals = engine_->get_signals();
  EXPECT_TRUE(signals.dtr);
  EXPECT_FALSE(signals.rts);
  EXPECT_TRUE(signals.dsr);
  EXPECT_FALSE(signals.cts);
  EXPECT_FALSE(signals.sending_break);

  // nullopt leaves a line alone
  engine_->set_signals(std::nullopt, true, true);
  signals = engine_->get_signals();
  EXPECT_TRUE(signals.dtr);
  EXPECT_TRUE(signals.rts);
  EXPECT_TRUE(signals.sending_break);
}

TEST_F(IoEngineTest, SignalFailureFaultsEngine) {
  start_engine();
  fake_->fail_signals(errc::make_error_code(errc::no_such_device));

  EXPECT_THROW(engine_->get_signals(), IoException);
  EXPECT_THROW(engine_->read_sync(util::Clock::duration::zero()), IoException);
  EXPECT_THROW(engine_->write(std::string_view("x")), IoException);
}

TEST_F(IoEngineTest, CloseWaitsForSignalAccess) {
  auto transport = std::make_unique<SlowSignalTransport>();
  auto* slow = transport.get();
  engine_ = IoEngine::create(std::move(transport), config::ConnectionConfig{}, ioc_.get_executor());
  engine_->start();

  std::atomic<bool> signals_read{false};
  std::thread caller([&]() {
    try {
      engine_->get_signals();
      signals_read.store(true);
    } catch (const IoException&) {
    }
  });
  ASSERT_TRUE(TestUtils::waitForCondition([&]() { return slow->in_call.load(); }, 1000));

  engine_->close();
  engine_->close_transport();
  caller.join();

  // The query that started first finishes before the handle goes away
  EXPECT_FALSE(slow->closed_during_call.load());
  EXPECT_TRUE(signals_read.load());
  EXPECT_FALSE(slow->is_open());
  EXPECT_THROW(engine_->get_signals(), IoClosedException);
  EXPECT_THROW(engine_->set_signals(true, std::nullopt, std::nullopt), IoClosedException);
}

TEST_F(IoEngineTest, LogCallbackMayQueryEngine) {
  start_engine();
  auto* engine = engine_.get();
  std::atomic<int> queries{0};
  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::DEBUG);
  diagnostics::Logger::instance().set_callback([engine, &queries](diagnostics::LogLevel, const std::string& line) {
    if (line.find("[engine]") != std::string::npos) {
      engine->incoming_size();
      engine->outgoing_size();
      ++queries;
    }
  });

  fake_->feed("ping");
  EXPECT_EQ(read_exactly(4), "ping");
  engine_->write(std::string_view("pong"));
  EXPECT_TRUE(engine_->drain_sync(util::timeout_of(2s)));
  fake_->fail_reads(errc::make_error_code(errc::io_error));
  EXPECT_TRUE(TestUtils::waitForCondition([&]() { return engine_->fault() != nullptr; }, 2000));

  diagnostics::Logger::instance().set_callback(nullptr);
  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
  EXPECT_GT(queries.load(), 0);
}

TEST_F(IoEngineTest, AsyncReadWithCallback) {
  start_engine();

  std::promise<std::string> result;
  engine_->async_read([&result](std::exception_ptr error, Bytes data) {
    if (error) {
      result.set_exception(error);
    } else {
      result.set_value(to_string(data));
    }
  });

  TestUtils::waitFor(20);
  fake_->feed("ping");

  auto future = result.get_future();
  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(future.get(), "ping");
}

TEST_F(IoEngineTest, AsyncReadWithFuture) {
  start_engine();
  fake_->feed("ready");
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->incoming_size() == 5; }));

  std::future<Bytes> future = engine_->async_read(boost::asio::use_future, 3);

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(to_string(future.get()), "rea");
}

TEST_F(IoEngineTest, AsyncReadFailsOnClose) {
  start_engine();

  std::future<Bytes> future = engine_->async_read(boost::asio::use_future);
  TestUtils::waitFor(50);
  ASSERT_EQ(future.wait_for(0s), std::future_status::timeout);

  engine_->close();

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(future.get(), IoClosedException);
}

TEST_F(IoEngineTest, AsyncDrain) {
  start_engine(2);
  fake_->hold_writes(true);
  engine_->write(std::string_view("abcdef"));

  std::future<bool> future = engine_->async_drain(boost::asio::use_future);
  TestUtils::waitFor(50);
  EXPECT_EQ(future.wait_for(0s), std::future_status::timeout);

  fake_->hold_writes(false);

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(future.get());
  EXPECT_EQ(fake_->output(), "abcdef");
}

TEST_F(IoEngineTest, AsyncOpsAfterFault) {
  start_engine();
  fake_->fail_reads(errc::make_error_code(errc::io_error));
  ASSERT_TRUE(TestUtils::waitForCondition([this]() { return engine_->fault() != nullptr; }));

  auto read = engine_->async_read(boost::asio::use_future);
  auto drain = engine_->async_drain(boost::asio::use_future);

  ASSERT_EQ(read.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(drain.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(read.get(), IoException);
  EXPECT_THROW(drain.get(), IoException);
}
