#include "gtest/gtest.h"
#include "test_helpers.hpp"
#include "utilities/subprocess.hpp"

using namespace sharedict;

TEST(SubprocessTest, PipesLargeInputThrough) {
  const auto input = sharedict_test::randomBytes(1 << 20, 8);
  auto res = runSubprocess({"cat"}, input);
  EXPECT_EQ(res.exitStatus, 0);
  EXPECT_EQ(res.out, input);
  EXPECT_TRUE(res.err.empty());
}

TEST(SubprocessTest, CapturesStderrAndExitStatus) {
  auto res = runSubprocess({"sh", "-c", "echo oops >&2; exit 3"}, {});
  EXPECT_EQ(res.exitStatus, 3);
  EXPECT_EQ(res.err, "oops\n");
  EXPECT_TRUE(res.out.empty());
}

TEST(SubprocessTest, ChildIgnoringStdinDoesNotHang) {
  const auto input = sharedict_test::randomBytes(1 << 20, 9);
  auto res = runSubprocess({"true"}, input);
  EXPECT_EQ(res.exitStatus, 0);
}

TEST(SubprocessTest, MissingProgramThrows) {
  EXPECT_THROW(runSubprocess({"sharedict-no-such-tool"}, {}),
               SubprocessError);
}
