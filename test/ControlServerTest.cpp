#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "ControlServer.h"
#include "SocketClient.h"

using nlohmann::json;

static json echo_handler(const json& req) {
  const std::string cmd = req.value("cmd", "");
  if (cmd == "boom") throw std::runtime_error("secret detail");
  if (cmd == "bad-bytes") return json{ { "status", "ok" }, { "vendor", "Acme \xff\xfe Corp" } };
  if (cmd == "big") return json{ { "status", "ok" }, { "blob", std::string(1 << 20, 'x') } };
  return json{ { "status", "ok" }, { "echo", req } };
}

TEST(ControlServer, AnswersOneLinePerRequest) {
  const std::string path = TestSocketPath("echo");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient c;
  ASSERT_TRUE(c.connect(path));
  // two requests in one write, the second split across writes
  ASSERT_TRUE(c.send("{\"cmd\":\"a\"}\n{\"cmd\":"));
  ASSERT_TRUE(c.send("\"b\"}\n"));

  json r1 = json::parse(c.readLine());
  json r2 = json::parse(c.readLine());
  EXPECT_EQ(r1["echo"]["cmd"], "a");
  EXPECT_EQ(r2["echo"]["cmd"], "b");
  server.stop();
}

TEST(ControlServer, MalformedLineKeepsConnectionOpen) {
  const std::string path = TestSocketPath("malformed");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient c;
  ASSERT_TRUE(c.connect(path));
  ASSERT_TRUE(c.send("this is not json\n"));
  json r = json::parse(c.readLine());
  EXPECT_EQ(r, json({ { "status", "error" }, { "message", "Invalid JSON" } }));

  ASSERT_TRUE(c.send("{\"cmd\":\"still-here\"}\n"));
  EXPECT_EQ(json::parse(c.readLine())["status"], "ok");
  server.stop();
}

TEST(ControlServer, HandlerExceptionsBecomeInternalError) {
  const std::string path = TestSocketPath("boom");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient c;
  ASSERT_TRUE(c.connect(path));
  ASSERT_TRUE(c.send("{\"cmd\":\"boom\"}\n"));
  const std::string line = c.readLine();
  EXPECT_EQ(json::parse(line), json({ { "status", "error" }, { "message", "Internal error" } }));
  EXPECT_EQ(line.find("secret"), std::string::npos);
  server.stop();
}

TEST(ControlServer, BroadcastReachesEveryClient) {
  const std::string path = TestSocketPath("broadcast");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient a, b;
  ASSERT_TRUE(a.connect(path));
  ASSERT_TRUE(b.connect(path));
  ASSERT_TRUE(WaitUntil([&] { return server.clientCount() == 2; }));

  server.broadcast(json{ { "event", "scan_complete" }, { "count", 3 } });
  EXPECT_EQ(json::parse(a.readLine())["count"], 3);
  EXPECT_EQ(json::parse(b.readLine())["count"], 3);

  // A departed client does not break fanout for the others.
  a.disconnect();
  ASSERT_TRUE(WaitUntil([&] { return server.clientCount() == 1; }));
  server.broadcast(json{ { "event", "scan_complete" }, { "count", 4 } });
  EXPECT_EQ(json::parse(b.readLine())["count"], 4);
  server.stop();
}

TEST(ControlServer, StopClosesClientsAndRemovesSocket) {
  const std::string path = TestSocketPath("stop");
  ControlServer server(path, 0600, echo_handler);
  ASSERT_TRUE(server.start());

  struct stat st{};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600u);

  SocketClient c;
  ASSERT_TRUE(c.connect(path));
  ASSERT_TRUE(WaitUntil([&] { return server.clientCount() == 1; }));

  server.stop();
  EXPECT_TRUE(c.closedByPeer());
  EXPECT_NE(access(path.c_str(), F_OK), 0);
}

TEST(ControlServer, StartReplacesStaleSocketFile) {
  const std::string path = TestSocketPath("stale");
  {
    ControlServer first(path, 0666, echo_handler);
    ASSERT_TRUE(first.start());
  }
  // leave a plain file where the socket goes
  FILE* f = std::fopen(path.c_str(), "w");
  ASSERT_NE(f, nullptr);
  std::fclose(f);

  ControlServer second(path, 0666, echo_handler);
  EXPECT_TRUE(second.start());
  second.stop();
}

TEST(ControlServer, SerializeReplacesInvalidUtf8) {
  std::string line;
  ASSERT_NO_THROW(line = ControlServer::Serialize(json{ { "vendor", "Acme \xff Corp" } }));
  ASSERT_EQ(line.back(), '\n');
  EXPECT_EQ(json::parse(line)["vendor"], "Acme \xEF\xBF\xBD Corp");
}

TEST(ControlServer, InvalidUtf8ResponseKeepsServing) {
  const std::string path = TestSocketPath("utf8");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient c;
  ASSERT_TRUE(c.connect(path));
  ASSERT_TRUE(c.send("{\"cmd\":\"bad-bytes\"}\n"));
  json r = json::parse(c.readLine());
  EXPECT_EQ(r["status"], "ok");
  EXPECT_EQ(r["vendor"], "Acme \xEF\xBF\xBD\xEF\xBF\xBD Corp");

  ASSERT_TRUE(c.send("{\"cmd\":\"again\"}\n"));
  EXPECT_EQ(json::parse(c.readLine())["echo"]["cmd"], "again");
  server.stop();
}

TEST(ControlServer, ClientThatStopsReadingIsDropped) {
  const std::string path = TestSocketPath("stalled");
  ControlServer server(path, 0666, echo_handler);
  ASSERT_TRUE(server.start());

  SocketClient stalled, reader;
  ASSERT_TRUE(stalled.connect(path));
  ASSERT_TRUE(reader.connect(path));
  ASSERT_TRUE(WaitUntil([&] { return server.clientCount() == 2; }));

  // Megabyte replies that are never read fill the socket buffer.
  ASSERT_TRUE(stalled.send("{\"cmd\":\"big\"}\n{\"cmd\":\"big\"}\n{\"cmd\":\"big\"}\n"));
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  auto fanout = std::async(std::launch::async, [&] {
    server.broadcast(json{ { "event", "scan_complete" }, { "count", 7 } });
  });
  ASSERT_EQ(fanout.wait_for(std::chrono::milliseconds(ControlServer::SEND_TIMEOUT_MS + 1000)),
            std::future_status::ready);
  EXPECT_EQ(json::parse(reader.readLine())["count"], 7);

  // A partial write followed by a timed-out one can take two timeouts.
  const int drop_ms = 2 * ControlServer::SEND_TIMEOUT_MS + 2000;
  ASSERT_TRUE(WaitUntil([&] { return server.clientCount() == 1; }, drop_ms));

  ASSERT_TRUE(reader.send("{\"cmd\":\"ping\"}\n"));
  EXPECT_EQ(json::parse(reader.readLine())["echo"]["cmd"], "ping");

  auto shutdown = std::async(std::launch::async, [&] { server.stop(); });
  EXPECT_EQ(shutdown.wait_for(std::chrono::seconds(3)), std::future_status::ready);
}
