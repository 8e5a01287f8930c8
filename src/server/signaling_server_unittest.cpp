#include "server/signaling_server.hpp"
#include "client/mesh_session.hpp"
#include "common/event.hpp"
#include "testing/fake_media.hpp"
#include "testing/fake_peer_transport.hpp"

#include <boost/asio/executor_work_guard.hpp>

#include <gtest/gtest.h>

#include <mutex>
#include <set>

#define ENABLE_UNIT_TESTS 1
#include "../testing/unittest_defines.hpp"

namespace meshrtc {
namespace test {
namespace {

constexpr int kWaitTimeoutMs = 5000;

// Signals the events the test waits for, called on the session queue.
class SessionObserver : public MeshSession::Observer {
public:
    void OnJoined(const std::string& room_id, size_t participant_count) override {
        joined_.Set();
    }
    void OnParticipantJoined(const std::string& participant_id, const std::optional<std::string>& name) override {}
    void OnParticipantLeft(const std::string& participant_id) override {
        participant_left_.Set();
    }
    void OnRemoteStreamsChanged(std::vector<RemoteStreamTable::Entry> entries) override {}
    void OnPeerStateChanged(const std::string& participant_id, NegotiationController::State state) override {
        if (state == NegotiationController::State::CONNECTED) {
            std::lock_guard lock(mutex_);
            connected_peers_.insert(participant_id);
            peer_connected_.Set();
        }
    }
    void OnError(MeshSession::ErrorKind kind, const std::string& message) override {
        {
            std::lock_guard lock(mutex_);
            errors_.push_back(message);
        }
        error_.Set();
    }

    Event& joined() { return joined_; }
    Event& peer_connected() { return peer_connected_; }
    Event& participant_left() { return participant_left_; }
    Event& error() { return error_; }

    std::set<std::string> connected_peers() const {
        std::lock_guard lock(mutex_);
        return connected_peers_;
    }
    std::vector<std::string> errors() const {
        std::lock_guard lock(mutex_);
        return errors_;
    }

private:
    Event joined_;
    Event peer_connected_;
    Event participant_left_;
    Event error_;
    mutable std::mutex mutex_;
    std::set<std::string> connected_peers_;
    std::vector<std::string> errors_;
};

} // namespace

class T(SignalingServerTest) : public ::testing::Test {
public:
    struct Client {
        FakeCaptureDevice capture_device;
        FakePeerTransportFactory factory;
        SessionObserver observer;
        std::unique_ptr<TaskQueue> task_queue;
        std::unique_ptr<MeshSession> session;

        ~Client() {
            // Leaves before the queue goes away.
            session.reset();
        }
    };
public:
    T(SignalingServerTest)() 
        : work_guard_(boost::asio::make_work_guard(ioc_)),
          io_thread_([this](){ ioc_.run(); }) {
        SignalingServer::Configuration config;
        config.address = "127.0.0.1";
        config.port = 0;
        server_ = std::make_unique<SignalingServer>(config);
        server_->Start();
        signaling_url_ = "ws://127.0.0.1:" + std::to_string(server_->port()) + "/";
    }

    ~T(SignalingServerTest)() override {
        clients_.clear();
        server_->Stop();
        work_guard_.reset();
        ioc_.stop();
        io_thread_.join();
    }

    Client* CreateClient() {
        auto client = std::make_unique<Client>();
        client->task_queue = std::make_unique<TaskQueue>("client." + std::to_string(clients_.size()));
        MeshSession::Configuration config;
        config.signaling_url = signaling_url_;
        client->session = std::make_unique<MeshSession>(config, 
                                                        &client->capture_device, 
                                                        &client->factory, 
                                                        CreateDefaultSignalingChannel(ioc_), 
                                                        client->task_queue.get(), 
                                                        &client->observer);
        clients_.push_back(std::move(client));
        return clients_.back().get();
    }

protected:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::thread io_thread_;
    std::unique_ptr<SignalingServer> server_;
    std::string signaling_url_;
    std::vector<std::unique_ptr<Client>> clients_;
};

MY_TEST_F(SignalingServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server_->is_running());
    EXPECT_NE(server_->port(), 0);
}

MY_TEST_F(SignalingServerTest, TwoParticipantsConnect) {
    auto alice = CreateClient();
    auto bob = CreateClient();

    ASSERT_TRUE(alice->session->Join("e2e", "Alice"));
    ASSERT_TRUE(alice->observer.joined().Wait(kWaitTimeoutMs));
    ASSERT_TRUE(bob->session->Join(" E2E ", "Bob"));
    ASSERT_TRUE(bob->observer.joined().Wait(kWaitTimeoutMs));

    ASSERT_TRUE(alice->observer.peer_connected().Wait(kWaitTimeoutMs));
    ASSERT_TRUE(bob->observer.peer_connected().Wait(kWaitTimeoutMs));
    EXPECT_EQ(alice->observer.connected_peers(), std::set<std::string>({bob->session->participant_id()}));
    EXPECT_EQ(bob->observer.connected_peers(), std::set<std::string>({alice->session->participant_id()}));
    EXPECT_EQ(server_->registry()->participant_count("E2E"), 2u);
    // One transport per side.
    EXPECT_EQ(alice->factory.live_count(), 1u);
    EXPECT_EQ(bob->factory.live_count(), 1u);

    alice->session->Leave();
    ASSERT_TRUE(bob->observer.participant_left().Wait(kWaitTimeoutMs));
    EXPECT_EQ(server_->registry()->participant_count("E2E"), 1u);
    EXPECT_TRUE(alice->observer.errors().empty());
    EXPECT_TRUE(bob->observer.errors().empty());
}

MY_TEST_F(SignalingServerTest, UnreachableServerIsReported) {
    server_->Stop();
    auto client = CreateClient();
    ASSERT_TRUE(client->session->Join("e2e"));
    ASSERT_TRUE(client->observer.error().Wait(kWaitTimeoutMs));
    client->task_queue->Invoke<void>([&](){
        EXPECT_EQ(client->session->state(), MeshSession::State::IDLE);
    });
    EXPECT_FALSE(client->observer.errors().empty());
}

} // namespace test
} // namespace meshrtc
