#ifndef BLOBSHARD_SHARD_GALOIS_HPP
#define BLOBSHARD_SHARD_GALOIS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blobshard::shard {

// Arithmetic in GF(2^8) with the reducing polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11D)
// and generator 2, the field used by the common Reed-Solomon erasure libraries.
class Galois {
public:
  static constexpr unsigned FIELD_SIZE = 256;
  static constexpr unsigned POLYNOMIAL = 0x11D;

  static uint8_t add(uint8_t a, uint8_t b) { return a ^ b; }
  static uint8_t multiply(uint8_t a, uint8_t b);
  // Throws InvalidDataError when b is zero
  static uint8_t divide(uint8_t a, uint8_t b);
  // a raised to the n-th power, with 0^0 == 1
  static uint8_t exp(uint8_t a, size_t n);

  // Row of the full multiplication table for coefficient c, indexed by the other factor
  static const uint8_t* multiplication_row(uint8_t c);
};

// Dense row-major matrix over GF(2^8)
class Matrix {
public:
  Matrix(size_t rows, size_t cols);

  static Matrix identity(size_t size);
  // Element (r, c) is r^c
  static Matrix vandermonde(size_t rows, size_t cols);

  size_t rows() const { return rows_; }
  size_t cols() const { return cols_; }

  uint8_t at(size_t row, size_t col) const { return data_[row * cols_ + col]; }
  uint8_t& at(size_t row, size_t col) { return data_[row * cols_ + col]; }
  const uint8_t* row(size_t row) const { return &data_[row * cols_]; }

  Matrix multiply(const Matrix& rhs) const;
  // Rows [row_begin, row_end) and columns [col_begin, col_end)
  Matrix sub_matrix(size_t row_begin, size_t col_begin, size_t row_end, size_t col_end) const;
  // Gauss-Jordan elimination, throws InvalidDataError for a singular matrix
  Matrix invert() const;

  bool operator==(const Matrix& other) const;

private:
  size_t rows_;
  size_t cols_;
  std::vector<uint8_t> data_;

  void swap_rows(size_t a, size_t b);
};

} // namespace blobshard::shard

#endif // BLOBSHARD_SHARD_GALOIS_HPP
