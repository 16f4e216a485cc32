#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <pty.h> // openpty
#include <thread>
#include <unistd.h>

namespace {

  struct Pty {
    int masterFd{ -1 };
    int slaveFd{ -1 };
    char slaveName[64]{};

    Pty() { openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr); }
    ~Pty() {
      if (masterFd >= 0)
        ::close(masterFd);
      if (slaveFd >= 0)
        ::close(slaveFd);
    }
    bool ok() const { return masterFd >= 0; }

    void send(const char* text) const {
      ASSERT_EQ(static_cast<ssize_t>(std::strlen(text)), ::write(masterFd, text, std::strlen(text)));
    }
  };

  std::string tempPath(const char* name) {
    return (std::filesystem::temp_directory_path() / name).string();
  }

} // namespace

TEST(serial_channel, opens_writes_closes) {
  // create a false ttyACM0 "device"
  Pty pty;
  ASSERT_TRUE(pty.ok());

  // check that we can open a serial channel to slave dev
  cloneflow::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B115200));

  // Writer on master side
  pty.send("{\"id\":1,\"ok\":null}\r\n");

  auto line = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "{\"id\":1,\"ok\":null}");

  ASSERT_TRUE(chan.writeLine("PONG"));
  char buf[16] = { 0 };
  ASSERT_GT(::read(pty.masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "PONG\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
}

TEST(serial_channel, two_lines_in_one_read_are_returned_in_order) {
  Pty pty;
  ASSERT_TRUE(pty.ok());
  cloneflow::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B115200));

  pty.send("first\r\nsecond\r\n");

  auto a = chan.readLine(std::chrono::milliseconds{ 500 });
  auto b = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(*a, "first");
  EXPECT_EQ(*b, "second");
}

TEST(serial_channel, partial_line_times_out_then_completes) {
  Pty pty;
  ASSERT_TRUE(pty.ok());
  cloneflow::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B115200));

  pty.send("{\"event\":");
  EXPECT_FALSE(chan.readLine(std::chrono::milliseconds{ 50 }));
  EXPECT_TRUE(chan.isOpen());

  pty.send("\"firmware-complete\"}\r\n");
  auto line = chan.readLine(std::chrono::milliseconds{ 500 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "{\"event\":\"firmware-complete\"}");
}

TEST(serial_channel, hangup_marks_link_down_without_releasing_the_fd) {
  Pty pty;
  ASSERT_TRUE(pty.ok());
  cloneflow::io::SerialChannel chan;
  ASSERT_TRUE(chan.open(pty.slaveName, B115200));

  ::close(pty.masterFd);
  pty.masterFd = -1;

  // reader sees the hangup while another thread keeps writing
  std::thread reader([&chan] {
    for (int i = 0; i < 20 && chan.isOpen(); ++i)
      static_cast<void>(chan.readLine(std::chrono::milliseconds{ 50 }));
  });
  for (int i = 0; i < 20 && chan.isOpen(); ++i)
    static_cast<void>(chan.writeLine("ping"));
  reader.join();
  EXPECT_FALSE(chan.isOpen());

  // a file opened now must not receive what is written to the dead link
  const auto path = tempPath("cloneflow_fd_reuse_test.txt");
  std::FILE* other = std::fopen(path.c_str(), "w+");
  ASSERT_NE(other, nullptr);
  EXPECT_FALSE(chan.writeLine("{\"id\":1,\"cmd\":\"reset_wizard\",\"args\":{}}"));
  std::fclose(other);
  EXPECT_EQ(std::filesystem::file_size(path), 0u);

  chan.close();
  std::filesystem::remove(path);
}

TEST(serial_channel, open_missing_device_fails) {
  cloneflow::io::SerialChannel chan;
  EXPECT_FALSE(chan.open("/dev/cloneflow-does-not-exist", B115200));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.writeLine("x"));
}

TEST(serial_channel, baud_from_config_accepts_standard_rates_only) {
  EXPECT_EQ(cloneflow::io::baudFromInt(115200), B115200);
  EXPECT_EQ(cloneflow::io::baudFromInt(9600), B9600);
  EXPECT_FALSE(cloneflow::io::baudFromInt(12345));
}

TEST(file_logger, appends_buffered_lines_on_flush) {
  const auto path = tempPath("cloneflow_file_logger_test.csv");
  std::filesystem::remove(path);

  {
    cloneflow::io::FileLogger log;
    ASSERT_TRUE(log.open(path));
    ASSERT_TRUE(log.write("a,b\n"));
    ASSERT_TRUE(log.flush());
    ASSERT_TRUE(log.write("c,d\n"));
    EXPECT_TRUE(log.close());
  }
  {
    cloneflow::io::FileLogger log; // reopen appends
    ASSERT_TRUE(log.open(path));
    ASSERT_TRUE(log.write("e,f\n"));
  }

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "a,b\nc,d\ne,f\n");
  std::filesystem::remove(path);
}

TEST(file_logger, write_without_open_fails) {
  cloneflow::io::FileLogger log;
  EXPECT_FALSE(log.isOpen());
  EXPECT_FALSE(log.write("x\n"));
  EXPECT_FALSE(log.flush());
}
