#include <multirender/panic.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace multirender;

namespace {

struct PanicException : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void throwing_panic_handler(const char* file, int line, const char* message) {
  throw PanicException{message};
}

class PanicTest : public ::testing::Test {
  protected:
    void SetUp() override {
      set_panic_handler(&throwing_panic_handler);
    }

    void TearDown() override {
      set_panic_handler(nullptr);
    }
};

} // anonymous namespace

TEST_F(PanicTest, HandlerReceivesFormattedMessage) {
  try {
    MULTIRENDER_PANIC("bad value {} in {}", 42, "slot");
    FAIL() << "panic returned";
  } catch(const PanicException& exception) {
    EXPECT_EQ(std::string{exception.what()}, "bad value 42 in slot");
  }
}

TEST_F(PanicTest, UnreachablePanics) {
  EXPECT_THROW({ MULTIRENDER_UNREACHABLE(); }, PanicException);
}

TEST_F(PanicTest, PanicMacroIsASingleStatement) {
  int taken = 0;
  const auto run = [&](int count) {
    for(int i = 0; i < count; i++) {
      if(i == 1)
        MULTIRENDER_PANIC("index {}", i);
      else
        taken++;
    }
  };

  EXPECT_NO_THROW(run(1));
  EXPECT_EQ(taken, 1);
  EXPECT_THROW(run(2), PanicException);
  EXPECT_EQ(taken, 2);
}

TEST(Panic, DefaultHandlerTerminatesTheProcess) {
  EXPECT_DEATH({ MULTIRENDER_PANIC("fatal"); }, "panic: .*fatal");
}
