#include "shard/galois.hpp"
#include "store/storage_error.hpp"
#include <array>
#include <utility>

namespace blobshard::shard {

namespace {

struct FieldTables {
  std::array<uint8_t, Galois::FIELD_SIZE> log{};
  // Doubled so exp[log a + log b] needs no modulo
  std::array<uint8_t, 2 * Galois::FIELD_SIZE> exp{};
  std::vector<uint8_t> mul;

  FieldTables() : mul(Galois::FIELD_SIZE * Galois::FIELD_SIZE, 0) {
    unsigned value = 1;
    for (unsigned i = 0; i < Galois::FIELD_SIZE - 1; ++i) {
      exp[i] = static_cast<uint8_t>(value);
      log[value] = static_cast<uint8_t>(i);
      value <<= 1;
      if (value & 0x100) {
        value ^= Galois::POLYNOMIAL;
      }
    }
    for (unsigned i = Galois::FIELD_SIZE - 1; i < exp.size(); ++i) {
      exp[i] = exp[i - (Galois::FIELD_SIZE - 1)];
    }

    for (unsigned a = 1; a < Galois::FIELD_SIZE; ++a) {
      for (unsigned b = 1; b < Galois::FIELD_SIZE; ++b) {
        mul[a * Galois::FIELD_SIZE + b] = exp[log[a] + log[b]];
      }
    }
  }
};

const FieldTables& tables() {
  static const FieldTables instance;
  return instance;
}

} // namespace


//==============================================
// FIELD ARITHMETIC
//==============================================

uint8_t Galois::multiply(uint8_t a, uint8_t b) {
  return tables().mul[static_cast<size_t>(a) * FIELD_SIZE + b];
}

uint8_t Galois::divide(uint8_t a, uint8_t b) {
  if (b == 0) {
    throw store::InvalidDataError("division by zero in GF(2^8)");
  }
  if (a == 0) {
    return 0;
  }
  const FieldTables& t = tables();
  int log_result = static_cast<int>(t.log[a]) - static_cast<int>(t.log[b]);
  if (log_result < 0) {
    log_result += FIELD_SIZE - 1;
  }
  return t.exp[log_result];
}

uint8_t Galois::exp(uint8_t a, size_t n) {
  if (n == 0) {
    return 1;
  }
  if (a == 0) {
    return 0;
  }
  const FieldTables& t = tables();
  size_t log_result = (static_cast<size_t>(t.log[a]) * n) % (FIELD_SIZE - 1);
  return t.exp[log_result];
}

const uint8_t* Galois::multiplication_row(uint8_t c) {
  return &tables().mul[static_cast<size_t>(c) * FIELD_SIZE];
}


//==============================================
// MATRIX
//==============================================

Matrix::Matrix(size_t rows, size_t cols)
  : rows_(rows)
  , cols_(cols)
  , data_(rows * cols, 0) {}

Matrix Matrix::identity(size_t size) {
  Matrix result(size, size);
  for (size_t i = 0; i < size; ++i) {
    result.at(i, i) = 1;
  }
  return result;
}

Matrix Matrix::vandermonde(size_t rows, size_t cols) {
  Matrix result(rows, cols);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      result.at(r, c) = Galois::exp(static_cast<uint8_t>(r), c);
    }
  }
  return result;
}

Matrix Matrix::multiply(const Matrix& rhs) const {
  if (cols_ != rhs.rows_) {
    throw store::InvalidDataError("matrix dimensions do not agree for multiplication");
  }

  Matrix result(rows_, rhs.cols_);
  for (size_t r = 0; r < rows_; ++r) {
    for (size_t c = 0; c < rhs.cols_; ++c) {
      uint8_t value = 0;
      for (size_t i = 0; i < cols_; ++i) {
        value ^= Galois::multiply(at(r, i), rhs.at(i, c));
      }
      result.at(r, c) = value;
    }
  }
  return result;
}

Matrix Matrix::sub_matrix(size_t row_begin, size_t col_begin, size_t row_end, size_t col_end) const {
  Matrix result(row_end - row_begin, col_end - col_begin);
  for (size_t r = row_begin; r < row_end; ++r) {
    for (size_t c = col_begin; c < col_end; ++c) {
      result.at(r - row_begin, c - col_begin) = at(r, c);
    }
  }
  return result;
}

Matrix Matrix::invert() const {
  if (rows_ != cols_) {
    throw store::InvalidDataError("only square matrices can be inverted");
  }

  // Augment with the identity, reduce the left half to the identity
  size_t n = rows_;
  Matrix work(n, 2 * n);
  for (size_t r = 0; r < n; ++r) {
    for (size_t c = 0; c < n; ++c) {
      work.at(r, c) = at(r, c);
    }
    work.at(r, n + r) = 1;
  }

  for (size_t r = 0; r < n; ++r) {
    if (work.at(r, r) == 0) {
      for (size_t below = r + 1; below < n; ++below) {
        if (work.at(below, r) != 0) {
          work.swap_rows(r, below);
          break;
        }
      }
    }
    if (work.at(r, r) == 0) {
      throw store::InvalidDataError("matrix is singular");
    }

    if (work.at(r, r) != 1) {
      uint8_t scale = Galois::divide(1, work.at(r, r));
      for (size_t c = 0; c < 2 * n; ++c) {
        work.at(r, c) = Galois::multiply(work.at(r, c), scale);
      }
    }

    for (size_t other = 0; other < n; ++other) {
      if (other == r || work.at(other, r) == 0) {
        continue;
      }
      uint8_t scale = work.at(other, r);
      for (size_t c = 0; c < 2 * n; ++c) {
        work.at(other, c) ^= Galois::multiply(scale, work.at(r, c));
      }
    }
  }

  return work.sub_matrix(0, n, n, 2 * n);
}

bool Matrix::operator==(const Matrix& other) const {
  return rows_ == other.rows_ && cols_ == other.cols_ && data_ == other.data_;
}

void Matrix::swap_rows(size_t a, size_t b) {
  for (size_t c = 0; c < cols_; ++c) {
    std::swap(data_[a * cols_ + c], data_[b * cols_ + c]);
  }
}

} // namespace blobshard::shard
