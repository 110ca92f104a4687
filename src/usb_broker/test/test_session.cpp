#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <vector>

#include "test_helpers.hpp"
#include "usb_broker/transport/frame_channel.hpp"
#include "usb_broker/transport/session.hpp"

using namespace std::chrono_literals;
using usb_broker::BrokerError;
using usb_broker::testing_util::WaitUntil;
using usb_broker::transport::InProcessChannel;
using usb_broker::transport::MakeInProcessChannelPair;
using usb_broker::transport::RecvStatus;
using usb_broker::transport::Session;
using usb_broker::transport::SessionOptions;
using usb_broker::transport::SessionRole;
using usb_broker::transport::TransferResult;

namespace {

broker::v1::TransferFrame BulkIn(uint32_t endpoint, uint32_t length) {
  broker::v1::TransferFrame f;
  f.set_type(broker::v1::TRANSFER_TYPE_BULK);
  f.set_endpoint(endpoint);
  f.set_direction(broker::v1::DIRECTION_IN);
  f.set_length(length);
  return f;
}

}  // namespace

class SessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto pair = MakeInProcessChannelPair("test");
    import_channel_ = pair.first;
    export_channel_ = pair.second;

    SessionOptions options;
    options.heartbeat_interval = 50ms;
    options.missed_heartbeat_limit = 3;
    import_ = std::make_shared<Session>("s-1", import_channel_,
                                        SessionRole::kImport, options);
    export_ = std::make_shared<Session>("s-1", export_channel_,
                                        SessionRole::kExport, options);
  }

  void TearDown() override {
    for (auto &s : {import_, export_}) {
      if (!s) continue;
      s->Close(broker::v1::CLOSE_REASON_SHUTDOWN, "test done");
      s->Join();
    }
  }

  // Export side echoes each submit back with its sequence in the payload.
  void StartEcho() {
    export_->SetSubmitHandler([this](const broker::v1::TransferFrame &submit) {
      {
        std::lock_guard<std::mutex> lock(seen_mutex_);
        seen_.push_back(submit.sequence());
      }
      broker::v1::TransferFrame done = submit;
      done.set_status(broker::v1::TRANSFER_STATUS_OK);
      done.set_payload("seq-" + std::to_string(submit.sequence()));
      done.set_actual_length(static_cast<uint32_t>(done.payload().size()));
      export_->Complete(done);
    });
    export_->Start();
    import_->Start();
  }

  std::shared_ptr<InProcessChannel> import_channel_;
  std::shared_ptr<InProcessChannel> export_channel_;
  std::shared_ptr<Session> import_;
  std::shared_ptr<Session> export_;

  std::mutex seen_mutex_;
  std::vector<uint64_t> seen_;
};

TEST_F(SessionTest, SubmitCompletesWithPayload) {
  StartEcho();
  uint64_t seq = 0;
  auto future = import_->Submit(BulkIn(0x81, 64), &seq);
  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);

  TransferResult result = future.get();
  EXPECT_EQ(seq, 1u);
  EXPECT_EQ(result.status, broker::v1::TRANSFER_STATUS_OK);
  EXPECT_EQ(result.data, "seq-1");
  EXPECT_EQ(result.error, BrokerError::kOk);
  EXPECT_EQ(import_->pending(), 0u);
}

TEST_F(SessionTest, PerEndpointOrderingIsPreserved) {
  StartEcho();
  std::vector<std::future<TransferResult>> futures;
  for (int i = 0; i < 50; ++i) {
    futures.push_back(import_->Submit(BulkIn(0x81, 8)));
    futures.push_back(import_->Submit(BulkIn(0x82, 8)));
  }
  for (auto &f : futures) {
    ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(f.get().status, broker::v1::TRANSFER_STATUS_OK);
  }

  std::lock_guard<std::mutex> lock(seen_mutex_);
  ASSERT_EQ(seen_.size(), 100u);
  // Interleaved endpoints each carry 1..50 in order
  for (size_t i = 0; i < seen_.size(); i += 2) {
    EXPECT_EQ(seen_[i], i / 2 + 1);
    EXPECT_EQ(seen_[i + 1], i / 2 + 1);
  }
  EXPECT_TRUE(import_->IsOpen());
}

TEST_F(SessionTest, SequenceRegressionClosesWithProtocolError) {
  export_->Start();

  // Drive the export side directly through the raw import channel
  auto send_submit = [this](uint64_t seq) {
    broker::v1::Frame f;
    *f.mutable_submit() = BulkIn(0x81, 8);
    f.mutable_submit()->set_sequence(seq);
    import_channel_->Send(f);
  };
  send_submit(2);
  send_submit(1);

  ASSERT_TRUE(export_->Wait(1s));
  EXPECT_EQ(export_->close_reason(), broker::v1::CLOSE_REASON_PROTOCOL_ERROR);
}

TEST_F(SessionTest, LocalCloseNotifiesPeerAndCancelsPending) {
  // Export side never completes
  export_->SetSubmitHandler([](const broker::v1::TransferFrame &) {});
  std::atomic<int> import_reason{broker::v1::CLOSE_REASON_UNSPECIFIED};
  std::atomic<bool> import_remote{false};
  std::atomic<bool> handled{false};
  import_->SetCloseHandler(
      [&](broker::v1::CloseReason reason, const std::string &, bool remote) {
        import_reason = reason;
        import_remote = remote;
        handled = true;
      });
  export_->Start();
  import_->Start();

  auto future = import_->Submit(BulkIn(0x81, 8));
  ASSERT_TRUE(WaitUntil([&] { return import_->pending() == 1u; }));

  export_->Close(broker::v1::CLOSE_REASON_REVOKED, "admin");
  ASSERT_TRUE(WaitUntil([&] { return handled.load(); }, 1s));
  EXPECT_EQ(import_reason.load(), broker::v1::CLOSE_REASON_REVOKED);
  EXPECT_TRUE(import_remote.load());

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  TransferResult result = future.get();
  EXPECT_EQ(result.status, broker::v1::TRANSFER_STATUS_CANCELLED);
  EXPECT_EQ(result.error, BrokerError::kInvalidToken);
}

TEST_F(SessionTest, SubmitAfterCloseFailsImmediately) {
  StartEcho();
  import_->Close(broker::v1::CLOSE_REASON_DEVICE_REMOVED, "");
  auto future = import_->Submit(BulkIn(0x81, 8));
  ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
  TransferResult result = future.get();
  EXPECT_EQ(result.status, broker::v1::TRANSFER_STATUS_CANCELLED);
  EXPECT_EQ(result.error, BrokerError::kDeviceRemoved);
}

TEST_F(SessionTest, HeartbeatsFlowWhileIdle) {
  StartEcho();
  ASSERT_TRUE(WaitUntil([&] { return import_->heartbeats_received() >= 3; }, 1s));
  EXPECT_TRUE(export_->heartbeats_received() >= 1);
  EXPECT_TRUE(import_->IsOpen());
  EXPECT_TRUE(export_->IsOpen());
}

TEST_F(SessionTest, PartitionTearsDownWithinHeartbeatBound) {
  export_->SetSubmitHandler([](const broker::v1::TransferFrame &) {});
  export_->Start();
  import_->Start();

  auto future = import_->Submit(BulkIn(0x81, 8));
  const auto start = std::chrono::steady_clock::now();
  import_channel_->SetPartitioned(true);

  // limit = 3 x 50ms; allow one extra interval of detection slack
  ASSERT_TRUE(import_->Wait(1s));
  ASSERT_TRUE(export_->Wait(1s));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, 500ms);

  for (Session *s : {import_.get(), export_.get()}) {
    const auto reason = s->close_reason();
    EXPECT_TRUE(reason == broker::v1::CLOSE_REASON_HEARTBEAT_TIMEOUT ||
                reason == broker::v1::CLOSE_REASON_TRANSPORT_ERROR)
        << usb_broker::transport::CloseReasonName(reason);
  }

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  EXPECT_EQ(future.get().error, BrokerError::kUnreachable);
}

TEST(CloseReasonTest, MapsToErrorTaxonomy) {
  using usb_broker::transport::CloseReasonToError;
  EXPECT_EQ(CloseReasonToError(broker::v1::CLOSE_REASON_LEASE_EXPIRED),
            BrokerError::kExpired);
  EXPECT_EQ(CloseReasonToError(broker::v1::CLOSE_REASON_REVOKED),
            BrokerError::kInvalidToken);
  EXPECT_EQ(CloseReasonToError(broker::v1::CLOSE_REASON_DEVICE_REMOVED),
            BrokerError::kDeviceRemoved);
  EXPECT_EQ(CloseReasonToError(broker::v1::CLOSE_REASON_HEARTBEAT_TIMEOUT),
            BrokerError::kUnreachable);
  EXPECT_EQ(CloseReasonToError(broker::v1::CLOSE_REASON_RELEASED),
            BrokerError::kCancelled);
}

TEST(InProcessChannelTest, DrainsQueuedFramesBeforeClosed) {
  auto pair = MakeInProcessChannelPair();
  broker::v1::Frame f;
  f.mutable_heartbeat()->set_counter(7);
  ASSERT_TRUE(pair.first->Send(f));
  pair.first->Close();

  broker::v1::Frame got;
  EXPECT_EQ(pair.second->Receive(&got, 10ms), RecvStatus::kFrame);
  EXPECT_EQ(got.heartbeat().counter(), 7u);
  EXPECT_EQ(pair.second->Receive(&got, 10ms), RecvStatus::kClosed);
  EXPECT_FALSE(pair.second->Send(f));
}

TEST_F(SessionTest, CloseHandlerMayDropLastReference) {
  std::weak_ptr<Session> watched = import_;
  std::atomic<bool> handled{false};
  import_->SetCloseHandler(
      [this, &handled](broker::v1::CloseReason, const std::string &, bool) {
        // Runs on the import reader thread
        import_.reset();
        handled = true;
      });
  StartEcho();

  export_->Close(broker::v1::CLOSE_REASON_REVOKED, "admin");
  ASSERT_TRUE(WaitUntil([&] { return handled.load(); }, 1s));
  // The session outlives its own threads and is freed once they return
  EXPECT_TRUE(WaitUntil([&] { return watched.expired(); }, 1s));
}
