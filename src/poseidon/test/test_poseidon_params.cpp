#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "poseidon.hpp"
#include "toy_field.hpp"

using namespace Poseidon;
using invZK::ErrorHandling::ConfigurationError;
using TestFields::ToyField;

class PoseidonParamsTest : public ::testing::Test {
 protected:
  void SetUp() override { FieldConstants::init(); }

  std::vector<std::vector<ToyField>> constants(size_t rounds, size_t width = 3) {
    return std::vector<std::vector<ToyField>>(
        rounds, std::vector<ToyField>(width, ToyField(1)));
  }

  std::vector<std::vector<ToyField>> identity_mds(size_t width = 3) {
    std::vector<std::vector<ToyField>> mds(width, std::vector<ToyField>(width));
    for (size_t i = 0; i < width; ++i) {
      mds[i][i] = ToyField(1);
    }
    return mds;
  }

  // Expects construction to fail with a ConfigurationError mentioning `fragment`
  template <typename Build>
  void expect_configuration_error(Build build, const std::string& fragment) {
    try {
      build();
      FAIL() << "expected ConfigurationError containing '" << fragment << "'";
    } catch (const ConfigurationError& e) {
      std::string message = e.what();
      EXPECT_EQ(message.rfind("invalid configuration: ", 0), 0u) << message;
      EXPECT_NE(message.find(fragment), std::string::npos) << message;
    }
  }
};

TEST_F(PoseidonParamsTest, InstanceConstants) {
  EXPECT_EQ(PoseidonParams::STATE_SIZE, 3);
  EXPECT_EQ(PoseidonParams::CAPACITY, 1);
  EXPECT_EQ(PoseidonParams::RATE, 2);
  EXPECT_EQ(PoseidonParams::ROUNDS_FULL, 8);
  EXPECT_EQ(PoseidonParams::ROUNDS_PARTIAL, 57);
  EXPECT_EQ(PoseidonParams::TOTAL_ROUNDS, 65);
  EXPECT_EQ(PoseidonParams::DOMAIN_CONSTANT, 3u);
}

TEST_F(PoseidonParamsTest, Bn254Bundle) {
  const auto& params = PoseidonConstants::parameters();

  EXPECT_EQ(params.width(), 3);
  EXPECT_EQ(params.rate(), 2);
  EXPECT_EQ(params.capacity(), 1);
  EXPECT_EQ(params.full_rounds(), 8);
  EXPECT_EQ(params.partial_rounds(), 57);
  EXPECT_EQ(params.total_rounds(), 65);
  EXPECT_EQ(params.domain_constant(), FieldElement(3));

  ASSERT_EQ(params.round_constants().size(), 65);
  for (const auto& tuple : params.round_constants()) {
    ASSERT_EQ(tuple.size(), 3);
    for (const auto& constant : tuple) {
      EXPECT_TRUE(constant < FieldConstants::MODULUS);
      EXPECT_FALSE(constant.is_zero());
    }
  }

  // First and last entries of the SHA-256 derived table
  EXPECT_EQ(params.round_constants(0)[0].to_hex(),
            "0x1b3f51758c09b9e6f7ce10e19350b938de344d87634b3af229405de4cc9be798");
  EXPECT_EQ(params.round_constants(64)[2].to_hex(),
            "0x1f2e012cbac892b6a9638f3d585dd868ac08b3b3f894f0cb7c3b2335b58860d3");

  // Shared, built once
  EXPECT_EQ(&params, &PoseidonConstants::parameters());
}

TEST_F(PoseidonParamsTest, Bn254MdsIsCauchyMatrix) {
  const auto& mds = PoseidonConstants::parameters().mds_matrix();
  ASSERT_EQ(mds.size(), 3);

  // M[i][j] = 1 / (i + 3 + j)
  for (uint64_t i = 0; i < 3; ++i) {
    ASSERT_EQ(mds[i].size(), 3);
    for (uint64_t j = 0; j < 3; ++j) {
      EXPECT_EQ(mds[i][j] * FieldElement(i + 3 + j), FieldConstants::ONE)
          << "entry (" << i << ", " << j << ")";
    }
  }
}

TEST_F(PoseidonParamsTest, ToyBundleIsValid) {
  auto params = TestFields::toy_parameters<ToyField>();
  EXPECT_EQ(params.total_rounds(), 7);
  EXPECT_EQ(params.round_constants(6)[2], ToyField(45));
  EXPECT_EQ(params.mds_matrix()[1][1], ToyField(2));

  // Rate one leaves a capacity of two
  PoseidonParameters<ToyField> narrow(1, 2, 1, constants(3), identity_mds(),
                                      ToyField(3));
  EXPECT_EQ(narrow.capacity(), 2);
}

TEST_F(PoseidonParamsTest, RejectsWrongWidth) {
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(3, 2, 1, constants(3, 4), identity_mds(4),
                                     ToyField(3), 4);
      },
      "width");
}

TEST_F(PoseidonParamsTest, RejectsRateOutOfRange) {
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(0, 2, 1, constants(3), identity_mds(),
                                     ToyField(3));
      },
      "rate");
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(3, 2, 1, constants(3), identity_mds(),
                                     ToyField(3));
      },
      "rate");
}

TEST_F(PoseidonParamsTest, RejectsOddOrZeroFullRounds) {
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 3, 1, constants(4), identity_mds(),
                                     ToyField(3));
      },
      "full rounds");
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 0, 1, constants(1), identity_mds(),
                                     ToyField(3));
      },
      "full rounds");
}

TEST_F(PoseidonParamsTest, RejectsRoundConstantCountMismatch) {
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 4, 3, constants(6), identity_mds(),
                                     ToyField(3));
      },
      "expected 7 round constant tuples, got 6");

  auto short_tuple = constants(7);
  short_tuple[4].pop_back();
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 4, 3, short_tuple, identity_mds(),
                                     ToyField(3));
      },
      "round constant tuple 4");
}

TEST_F(PoseidonParamsTest, RejectsMalformedMds) {
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 4, 3, constants(7), identity_mds(2),
                                     ToyField(3));
      },
      "rows");

  auto ragged = identity_mds();
  ragged[2].push_back(ToyField(1));
  expect_configuration_error(
      [&] {
        PoseidonParameters<ToyField>(2, 4, 3, constants(7), ragged,
                                     ToyField(3));
      },
      "square");
}

TEST_F(PoseidonParamsTest, ConfigurationErrorIsValidationError) {
  EXPECT_THROW(PoseidonParameters<ToyField>(2, 4, 3, constants(1),
                                            identity_mds(), ToyField(3)),
               invZK::ErrorHandling::ValidationError);
  EXPECT_THROW(PoseidonParameters<ToyField>(2, 4, 3, constants(1),
                                            identity_mds(), ToyField(3)),
               std::invalid_argument);
}
