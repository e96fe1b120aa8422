#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <array>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

//////////////////////
// Tests for Random //
//////////////////////

TEST(Random, same_seed_same_stream) {
  std::mt19937 prng1 = util::Random::make_prng(12345);
  std::mt19937 prng2 = util::Random::make_prng(12345);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(util::Random::uniform_real(prng1, 0.0, 1.0),
              util::Random::uniform_real(prng2, 0.0, 1.0));
  }
}

TEST(Random, high_seed_bits_matter) {
  util::Random::seed_t low = 7;
  util::Random::seed_t high = low | (util::Random::seed_t(1) << 40);
  std::mt19937 prng1 = util::Random::make_prng(low);
  std::mt19937 prng2 = util::Random::make_prng(high);

  int num_equal = 0;
  for (int i = 0; i < 10; ++i) {
    num_equal += (prng1() == prng2());
  }
  EXPECT_LT(num_equal, 10);
}

TEST(Random, nondeterministic_seed_is_nonzero) {
  for (int i = 0; i < 10; ++i) {
    EXPECT_NE(util::Random::nondeterministic_seed(), 0u);
  }
}

TEST(Random, uniform_real) {
  std::mt19937 prng = util::Random::make_prng(1);
  for (int i = 0; i < 1000; ++i) {
    double x = util::Random::uniform_real(prng, -10.0, 10.0);
    EXPECT_GE(x, -10.0);
    EXPECT_LT(x, 10.0);
  }

  EXPECT_THROW(util::Random::uniform_real(prng, 1.0, 1.0), util::Exception);
  EXPECT_THROW(util::Random::uniform_real(prng, 2.0, 1.0), util::Exception);
}

TEST(Random, weighted_sample) {
  std::mt19937 prng = util::Random::make_prng(1);
  std::array<double, 4> weights = {1, 0, 3, 0};
  std::array<int, 4> counts = {};

  constexpr int N = 10000;
  for (int i = 0; i < N; ++i) {
    int k = util::Random::weighted_sample(prng, weights.begin(), weights.end());
    ASSERT_GE(k, 0);
    ASSERT_LT(k, 4);
    counts[k]++;
  }
  EXPECT_EQ(counts[1], 0);
  EXPECT_EQ(counts[3], 0);
  EXPECT_NEAR(counts[0] * 1.0 / N, 0.25, 0.02);
  EXPECT_NEAR(counts[2] * 1.0 / N, 0.75, 0.02);
}

////////////////////////////
// End tests for Random //
////////////////////////////

/////////////////////////
// Tests for BoostUtil //
/////////////////////////

namespace {

struct TestParams {
  int num_widgets = 3;
  double scale = 1.0;
  bool verbose = false;

  auto make_options_description() {
    namespace po = boost::program_options;
    po::options_description desc("TestParams options");
    desc.add_options()
      ("num-widgets", po::value<int>(&num_widgets)->default_value(num_widgets), "widgets")
      ("scale", po::value<double>(&scale)->default_value(scale), "scale")
      ("verbose", po::bool_switch(&verbose), "verbose");
    return desc;
  }
};

boost::filesystem::path temp_path(const std::string& name) {
  return boost::filesystem::temp_directory_path() /
         boost::filesystem::unique_path(name + "-%%%%-%%%%");
}

std::string read_file(const boost::filesystem::path& path) {
  std::ifstream file(path.string());
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace

TEST(BoostUtil, parse_args) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  std::vector<std::string> args = {"--num-widgets", "7", "--verbose"};
  po2::parse_args(params.make_options_description(), args);
  EXPECT_EQ(params.num_widgets, 7);
  EXPECT_EQ(params.scale, 1.0);
  EXPECT_TRUE(params.verbose);
}

TEST(BoostUtil, parse_args_errors) {
  namespace po2 = boost_util::program_options;

  TestParams params;
  std::vector<std::string> unknown = {"--num-gadgets", "7"};
  EXPECT_THROW(po2::parse_args(params.make_options_description(), unknown),
               util::CleanException);

  std::vector<std::string> malformed = {"--scale", "big"};
  EXPECT_THROW(po2::parse_args(params.make_options_description(), malformed),
               util::CleanException);
}

TEST(BoostUtil, write_str_to_file) {
  boost::filesystem::path path = temp_path("write_str_to_file");

  boost_util::write_str_to_file("a,b\n", path);
  EXPECT_EQ(read_file(path), "a,b\n");

  boost_util::write_str_to_file("1,2\n", path, true);
  EXPECT_EQ(read_file(path), "a,b\n1,2\n");

  boost_util::write_str_to_file("3,4\n", path);
  EXPECT_EQ(read_file(path), "3,4\n");

  boost::filesystem::remove(path);
}

TEST(BoostUtil, write_str_to_file_bad_path) {
  boost::filesystem::path path = temp_path("missing-dir") / "file.csv";
  EXPECT_THROW(boost_util::write_str_to_file("x", path), util::CleanException);
}

/////////////////////////////
// End tests for BoostUtil //
/////////////////////////////

///////////////////////
// Tests for Asserts //
///////////////////////

TEST(Asserts, release_assert) {
  int x = 3;
  EXPECT_NO_THROW(RELEASE_ASSERT(x == 3));
  EXPECT_THROW(RELEASE_ASSERT(x == 4), util::ReleaseAssertionError);
  EXPECT_THROW(RELEASE_ASSERT(x == 4, "x={}", x), util::ReleaseAssertionError);
}

TEST(Asserts, clean_assert) {
  int x = 3;
  EXPECT_THROW(CLEAN_ASSERT(x < 0, "x={} must be negative", x), util::CleanException);
}

TEST(Asserts, message) {
  try {
    RELEASE_ASSERT(1 + 1 == 3, "math is broken: {}", 42);
    FAIL() << "RELEASE_ASSERT did not throw";
  } catch (const util::ReleaseAssertionError& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT"), std::string::npos);
    EXPECT_NE(what.find("math is broken: 42"), std::string::npos);
  }
}

///////////////////////////
// End tests for Asserts //
///////////////////////////

TEST(CppUtil, timer) {
  util::Timer timer;
  EXPECT_GE(timer.elapsed_ns(), 0);
  EXPECT_GE(timer.elapsed_seconds(), 0.0);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
