#include <solo/common/exceptions.hpp>
#include <solo/common/util.hpp>

#include <cerrno>

#include <gtest/gtest.h>

using namespace solo::common;

TEST(Exceptions, KindNames)
{
  EXPECT_EQ(error_kind_to_string(ErrorKind::MISSING_ENVIRONMENT), "MissingEnvironment");
  EXPECT_EQ(error_kind_to_string(ErrorKind::SPAWN_FAILED), "SpawnFailed");
  EXPECT_EQ(error_kind_to_string(ErrorKind::UNKNOWN_READY), "UnknownReady");
  EXPECT_EQ(error_kind_to_string(ErrorKind::UNKNOWN_OK), "UnknownOk");
  EXPECT_EQ(error_kind_to_string(ErrorKind::MALFORMED_PAYLOAD), "MalformedPayload");
  EXPECT_EQ(error_kind_to_string(ErrorKind::MESSAGE_TOO_LARGE), "MessageTooLarge");
  EXPECT_EQ(error_kind_to_string(ErrorKind::CHANNEL_IO), "ChannelIo");
  EXPECT_EQ(error_kind_to_string(ErrorKind::TIMEOUT), "Timeout");
  EXPECT_EQ(error_kind_to_string(ErrorKind::INVALID_CONFIGURATION), "InvalidConfiguration");
}

TEST(Exceptions, KindTravelsWithException)
{
  try {
    throw SpawnFailed{"No such file or directory"};
  } catch (SoloException& exc) {
    EXPECT_EQ(exc.kind(), ErrorKind::SPAWN_FAILED);
    EXPECT_STREQ(exc.what(), "No such file or directory");
  }

  EXPECT_EQ(UnknownReady{"WRONG"}.kind(), ErrorKind::UNKNOWN_READY);
  EXPECT_EQ(UnknownOk{"WRONG"}.kind(), ErrorKind::UNKNOWN_OK);
  EXPECT_EQ(Timeout{""}.kind(), ErrorKind::TIMEOUT);
  EXPECT_EQ(InvalidConfigurationError{""}.kind(), ErrorKind::INVALID_CONFIGURATION);
}

TEST(Util, ExpectZero)
{
  EXPECT_TRUE(util::expect_zero(0));
  EXPECT_FALSE(util::expect_zero(-1));
}

TEST(Util, ErrnoMessage)
{
  EXPECT_EQ(util::errno_message(ENOENT), "errno 2, message No such file or directory");
}
