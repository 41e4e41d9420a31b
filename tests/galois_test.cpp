#include <gtest/gtest.h>
#include "shard/galois.hpp"
#include "store/storage_error.hpp"

using namespace blobshard::shard;

TEST(GaloisTest, Addition) {
  EXPECT_EQ(Galois::add(0x53, 0xCA), 0x99);
  EXPECT_EQ(Galois::add(0x42, 0x42), 0);
}

TEST(GaloisTest, Multiplication) {
  EXPECT_EQ(Galois::multiply(0, 0x57), 0);
  EXPECT_EQ(Galois::multiply(1, 0x57), 0x57);
  EXPECT_EQ(Galois::multiply(3, 7), 9);
  // x * x^7 wraps through the reducing polynomial
  EXPECT_EQ(Galois::multiply(2, 0x80), 0x1D);
  EXPECT_EQ(Galois::exp(2, 8), 0x1D);
}

TEST(GaloisTest, FieldAxioms) {
  for (unsigned a = 0; a < Galois::FIELD_SIZE; ++a) {
    for (unsigned b = 0; b < Galois::FIELD_SIZE; ++b) {
      uint8_t x = static_cast<uint8_t>(a);
      uint8_t y = static_cast<uint8_t>(b);
      ASSERT_EQ(Galois::multiply(x, y), Galois::multiply(y, x));
      if (y != 0) {
        ASSERT_EQ(Galois::divide(Galois::multiply(x, y), y), x);
      }
    }
  }
}

TEST(GaloisTest, Exponent) {
  EXPECT_EQ(Galois::exp(0, 0), 1);
  EXPECT_EQ(Galois::exp(0, 5), 0);
  EXPECT_EQ(Galois::exp(7, 1), 7);
  EXPECT_EQ(Galois::exp(2, 255), 1);
  EXPECT_EQ(Galois::exp(5, 3), Galois::multiply(5, Galois::multiply(5, 5)));
}

TEST(GaloisTest, DivisionByZero) {
  EXPECT_THROW(Galois::divide(3, 0), blobshard::store::InvalidDataError);
}

TEST(GaloisTest, MultiplicationRow) {
  const uint8_t* row = Galois::multiplication_row(0x8E);
  for (unsigned b = 0; b < Galois::FIELD_SIZE; ++b) {
    ASSERT_EQ(row[b], Galois::multiply(0x8E, static_cast<uint8_t>(b)));
  }
}

TEST(MatrixTest, IdentityAndMultiply) {
  Matrix vandermonde = Matrix::vandermonde(5, 3);
  Matrix identity = Matrix::identity(3);
  EXPECT_EQ(vandermonde.multiply(identity), vandermonde);

  EXPECT_EQ(vandermonde.at(0, 0), 1);
  EXPECT_EQ(vandermonde.at(0, 1), 0);
  EXPECT_EQ(vandermonde.at(2, 2), Galois::multiply(2, 2));
  EXPECT_EQ(vandermonde.at(4, 1), 4);
}

TEST(MatrixTest, Inverse) {
  for (size_t size : {1u, 2u, 4u, 10u}) {
    Matrix square = Matrix::vandermonde(size, size);
    Matrix inverse = square.invert();
    EXPECT_EQ(square.multiply(inverse), Matrix::identity(size)) << size;
    EXPECT_EQ(inverse.multiply(square), Matrix::identity(size)) << size;
  }
}

TEST(MatrixTest, SingularMatrix) {
  Matrix singular(2, 2);
  singular.at(0, 0) = 3;
  singular.at(0, 1) = 5;
  singular.at(1, 0) = 3;
  singular.at(1, 1) = 5;
  EXPECT_THROW(singular.invert(), blobshard::store::InvalidDataError);
}

TEST(MatrixTest, SubMatrix) {
  Matrix vandermonde = Matrix::vandermonde(6, 4);
  Matrix sub = vandermonde.sub_matrix(2, 1, 5, 3);
  ASSERT_EQ(sub.rows(), 3u);
  ASSERT_EQ(sub.cols(), 2u);
  for (size_t r = 0; r < 3; ++r) {
    for (size_t c = 0; c < 2; ++c) {
      EXPECT_EQ(sub.at(r, c), vandermonde.at(r + 2, c + 1));
    }
  }
}
