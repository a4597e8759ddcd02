#include <gtest/gtest.h>
#include "../../src/supervisor/log_event_classifier.h"

using namespace ClipBridge;

class LogEventClassifierTest : public ::testing::Test {
protected:
    ClassifiedEvent Stdout(const std::string& text) const {
        return server_.Classify(LogLine{StreamKind::Primary, text});
    }

    ClassifiedEvent Stderr(const std::string& text) const {
        return server_.Classify(LogLine{StreamKind::Diagnostic, text});
    }

    LogEventClassifier server_{ClassifierRules::ForRole(WorkerRole::Server)};
    LogEventClassifier client_{ClassifierRules::ForRole(WorkerRole::Client)};
};

TEST_F(LogEventClassifierTest, PeerConnectedCapturesAddress) {
    auto event = Stdout("INFO     | New WebSocket connection from 127.0.0.1");
    ASSERT_TRUE(std::holds_alternative<PeerConnected>(event));
    EXPECT_EQ(std::get<PeerConnected>(event).address, "127.0.0.1");

    event = Stdout("New connection from 192.168.1.50");
    ASSERT_TRUE(std::holds_alternative<PeerConnected>(event));
    EXPECT_EQ(std::get<PeerConnected>(event).address, "192.168.1.50");
}

TEST_F(LogEventClassifierTest, PeerMarkersAreCaseInsensitive) {
    auto event = Stdout("new connection from 10.0.0.5");
    ASSERT_TRUE(std::holds_alternative<PeerConnected>(event));

    event = Stdout("CLIENT 10.0.0.5 DISCONNECTED");
    ASSERT_TRUE(std::holds_alternative<PeerDisconnected>(event));
}

TEST_F(LogEventClassifierTest, PeerDisconnectedCapturesAddress) {
    auto event = Stdout("Client 127.0.0.1 disconnected. Total clients: 0");
    ASSERT_TRUE(std::holds_alternative<PeerDisconnected>(event));
    EXPECT_EQ(std::get<PeerDisconnected>(event).address, "127.0.0.1");
}

TEST_F(LogEventClassifierTest, MalformedAddressesFallThrough) {
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("New WebSocket connection from invalid-ip")));
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("New WebSocket connection from")));
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("New connection from 10.0.5")));
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("New connection from 10.0.0.256")));
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("New connection from 1.2.3.4.5")));
    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("Client 999.1.1.1 disconnected")));
}

TEST_F(LogEventClassifierTest, ReadinessMarkerPerRole) {
    EXPECT_TRUE(std::holds_alternative<ReadySignal>(Stdout("Server started successfully on port 8000")));
    // Either stream counts
    EXPECT_TRUE(std::holds_alternative<ReadySignal>(Stderr("INFO: Server started successfully")));

    auto client_ready = client_.Classify(LogLine{StreamKind::Primary, "Connected to server successfully"});
    EXPECT_TRUE(std::holds_alternative<ReadySignal>(client_ready));

    // The server marker means nothing to a client worker
    auto client_other = client_.Classify(LogLine{StreamKind::Primary, "Server started successfully"});
    EXPECT_TRUE(std::holds_alternative<InfoLine>(client_other));
}

TEST_F(LogEventClassifierTest, DependencyErrorsOnEitherStream) {
    auto event = Stderr("ModuleNotFoundError: No module named 'websockets'");
    ASSERT_TRUE(std::holds_alternative<DependencyError>(event));
    EXPECT_EQ(std::get<DependencyError>(event).detail, "ModuleNotFoundError: No module named 'websockets'");

    EXPECT_TRUE(std::holds_alternative<DependencyError>(Stdout("ImportError: cannot import name 'x'")));
}

TEST_F(LogEventClassifierTest, GenericErrorsOnlyOnDiagnosticStream) {
    auto event = Stderr("ERROR: something broke");
    ASSERT_TRUE(std::holds_alternative<GenericError>(event));
    EXPECT_EQ(std::get<GenericError>(event).detail, "ERROR: something broke");

    EXPECT_TRUE(std::holds_alternative<GenericError>(Stderr("Traceback (most recent call last):")));
    EXPECT_TRUE(std::holds_alternative<GenericError>(Stderr("CRITICAL: disk full")));
    EXPECT_TRUE(std::holds_alternative<GenericError>(Stderr("ValueError Exception raised")));

    EXPECT_TRUE(std::holds_alternative<InfoLine>(Stdout("ERROR: printed on stdout")));
}

TEST_F(LogEventClassifierTest, CheckOrderPrefersPeerEventsOverMarkers) {
    // A connect line that also mentions an error is still a connect
    auto event = Stderr("ERROR: New connection from 10.1.1.1");
    ASSERT_TRUE(std::holds_alternative<PeerConnected>(event));

    // Readiness beats dependency substrings
    event = Stdout("Server started successfully despite ImportError warnings");
    EXPECT_TRUE(std::holds_alternative<ReadySignal>(event));
}

TEST_F(LogEventClassifierTest, EverythingElseIsInfo) {
    auto event = Stdout("INFO     | Starting WebSocket message loop");
    ASSERT_TRUE(std::holds_alternative<InfoLine>(event));
    EXPECT_EQ(std::get<InfoLine>(event).text, "INFO     | Starting WebSocket message loop");
}

TEST_F(LogEventClassifierTest, IPv4Validation) {
    EXPECT_TRUE(LogEventClassifier::IsValidIPv4("0.0.0.0"));
    EXPECT_TRUE(LogEventClassifier::IsValidIPv4("255.255.255.255"));
    EXPECT_FALSE(LogEventClassifier::IsValidIPv4("256.0.0.1"));
    EXPECT_FALSE(LogEventClassifier::IsValidIPv4("1.2.3"));
    EXPECT_FALSE(LogEventClassifier::IsValidIPv4("1.2.3.4.5"));
    EXPECT_FALSE(LogEventClassifier::IsValidIPv4("1..3.4"));
    EXPECT_FALSE(LogEventClassifier::IsValidIPv4(""));
}
