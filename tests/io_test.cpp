// FlowCal-Prod headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

// GTest headers
#include <gtest/gtest.h>

// Linux headers
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <pty.h> // openpty
#include <sstream>
#include <thread>
#include <unistd.h>

using flowcal::io::ChannelError;
using flowcal::io::SerialChannel;
using flowcal::io::SerialSettings;

namespace {

  // a false ttyUSB0 "device": the test talks on the master side
  struct Pty {
    int masterFd = -1;
    int slaveFd = -1;
    char slaveName[64] = { 0 };

    Pty() { openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr); }
    ~Pty() {
      ::close(masterFd);
      ::close(slaveFd);
    }

    SerialSettings settings(const std::string& terminator = "\n") const {
      SerialSettings s;
      s.port = slaveName;
      s.baudRate = 115200;
      s.readTimeout = std::chrono::milliseconds{ 100 };
      s.lineTerminator = terminator;
      return s;
    }

    void send(const char* text) const { ASSERT_GT(::write(masterFd, text, strlen(text)), 0); }

    std::string receive() const {
      char buf[64] = { 0 };
      ssize_t n = ::read(masterFd, buf, sizeof(buf) - 1);
      return n > 0 ? std::string(buf, static_cast<std::size_t>(n)) : std::string();
    }
  };

  std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
  }

} // namespace

TEST(serial_channel, opens_writes_closes) {
  Pty pty;
  ASSERT_GE(pty.masterFd, 0);

  // check that we can open a serial channel to slave dev
  SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.settings()));
  EXPECT_TRUE(chan.isOpen());

  // Writer on master side
  pty.send("PING\n");

  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "PING");

  ASSERT_TRUE(chan.writeLine("PONG"));
  EXPECT_EQ(pty.receive(), "PONG\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, splits_on_configured_terminator) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.settings("\r")));

  // two frames in one burst: the second stays buffered for the next read
  pty.send("A +014.70 +025.00\rA +000.00\r");

  auto first = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, "A +014.70 +025.00");

  auto second = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, "A +000.00");

  ASSERT_TRUE(chan.writeLine("AS1.000"));
  EXPECT_EQ(pty.receive(), "AS1.000\r");
}

TEST(serial_channel, read_times_out_without_a_terminator) {
  Pty pty;
  SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.settings()));

  pty.send("partial");
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 50 }));
  EXPECT_EQ(chan.lastError(), ChannelError::Timeout);

  // the partial line is kept and completed by the next burst
  pty.send(" line\n");
  auto line = chan.readLine(std::chrono::milliseconds{ 100 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "partial line");
}

TEST(serial_channel, missing_port_is_unavailable) {
  SerialChannel chan;
  SerialSettings s;
  s.port = "/dev/flowcal-no-such-port";

  EXPECT_FALSE(chan.open(s));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_EQ(chan.lastError(), ChannelError::PortUnavailable);
}

TEST(serial_channel, second_claim_on_a_port_is_refused) {
  Pty pty;
  SerialChannel first;
  ASSERT_TRUE(first.open(pty.settings()));

  SerialChannel second;
  EXPECT_FALSE(second.open(pty.settings()));
  EXPECT_EQ(second.lastError(), ChannelError::PortUnavailable);
}

TEST(serial_channel, unsupported_baud_has_no_termios_speed) {
  EXPECT_TRUE(flowcal::io::toSpeed(19200));
  EXPECT_FALSE(flowcal::io::toSpeed(12345));

  Pty pty;
  auto s = pty.settings();
  s.baudRate = 12345;
  SerialChannel chan;
  EXPECT_FALSE(chan.open(s));
  EXPECT_EQ(chan.lastError(), ChannelError::PortUnavailable);
}

TEST(serial_channel, io_on_closed_channel_reports_disconnected) {
  SerialChannel chan;
  EXPECT_FALSE(chan.writeLine("VOUT1?"));
  EXPECT_EQ(chan.lastError(), ChannelError::Disconnected);
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 10 }));
  EXPECT_EQ(chan.lastError(), ChannelError::Disconnected);
}

TEST(file_logger, buffers_until_flush) {
  const std::string path = ::testing::TempDir() + "flowcal_file_logger.txt";
  flowcal::io::FileLogger file;
  ASSERT_TRUE(file.open(path));
  file.write("hello\n");
  ASSERT_TRUE(file.flush());
  EXPECT_EQ(slurp(path), "hello\n");
  file.close();
  EXPECT_FALSE(file.isOpen());
  std::remove(path.c_str());
}

TEST(run_logger, writes_header_and_rows) {
  const std::string path = ::testing::TempDir() + "flowcal_run_log.csv";
  flowcal::core::Logger logger;
  ASSERT_TRUE(logger.startNewRun(path));

  flowcal::core::LogEvent event;
  event.dutIndex = 2;
  event.serialNumber = "SN-2";
  event.setpoint = 10.0;
  event.reference = 10.05;
  event.measured = 8.0;
  event.result = "out of tolerance";
  ASSERT_TRUE(logger.log(event));
  logger.finishRun();
  EXPECT_FALSE(logger.running());

  const auto text = slurp(path);
  EXPECT_EQ(text.rfind("timestamp,dut,serial,setpoint,reference,measured,result\n", 0), 0u);
  EXPECT_NE(text.find(",2,SN-2,10.0000,10.0500,8.0000,out of tolerance"), std::string::npos);
  std::remove(path.c_str());
}

TEST(run_logger, finish_writes_every_row_already_queued) {
  const std::string path = ::testing::TempDir() + "flowcal_run_log_burst.csv";
  constexpr int kRows = 500;

  for (int round = 0; round < 5; ++round) {
    flowcal::core::Logger logger;
    ASSERT_TRUE(logger.startNewRun(path));
    // let the writer settle into its idle wait before the burst arrives
    std::this_thread::sleep_for(std::chrono::milliseconds(20 + 10 * round));

    flowcal::core::LogEvent event;
    event.serialNumber = "SN";
    event.result = "pass";
    for (int i = 0; i < kRows; ++i) {
      event.dutIndex = static_cast<unsigned>(i);
      ASSERT_TRUE(logger.log(event));
    }
    logger.finishRun();

    std::istringstream lines(slurp(path));
    std::string line;
    int rows = -1; // header
    while (std::getline(lines, line))
      ++rows;
    EXPECT_EQ(rows, kRows) << "round " << round;
  }
  std::remove(path.c_str());
}
