#include "internal/util/time.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

void TestParsesDocumentTimestamp() {
  const auto epoch = mlmeta::util::ParseDocumentTimestamp("2021-01-01 00:00:00.000000");
  assert(epoch);
  assert(*epoch == 1609459200LL * kNanosPerSecond);

  const auto with_micros = mlmeta::util::ParseDocumentTimestamp("2021-01-01 00:00:01.000250");
  assert(with_micros);
  assert(*with_micros == 1609459201LL * kNanosPerSecond + 250'000);
}

void TestRejectsOtherShapes() {
  assert(!mlmeta::util::ParseDocumentTimestamp(""));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-01-01"));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-01-01T00:00:00.000000"));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-01-01 00:00:00.000"));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-02-30 00:00:00.000000"));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-01-01 24:00:00.000000"));
  assert(!mlmeta::util::ParseDocumentTimestamp("2021-0a-01 00:00:00.000000"));
}

void TestRejectsOutOfRangeYears() {
  // Last and first microsecond representable as int64 epoch nanoseconds.
  const auto latest = mlmeta::util::ParseDocumentTimestamp("2262-04-11 23:47:16.854775");
  assert(latest);
  assert(*latest == 9'223'372'036'854'775'000LL);
  assert(!mlmeta::util::ParseDocumentTimestamp("2262-04-11 23:47:16.854776"));

  const auto earliest = mlmeta::util::ParseDocumentTimestamp("1677-09-21 00:12:43.145225");
  assert(earliest);
  assert(*earliest == -9'223'372'036'854'775'000LL);
  assert(!mlmeta::util::ParseDocumentTimestamp("1677-09-21 00:12:43.145224"));

  assert(!mlmeta::util::ParseDocumentTimestamp("9999-12-31 23:59:59.999999"));
  assert(!mlmeta::util::ParseDocumentTimestamp("0001-01-01 00:00:00.000000"));
}

} // namespace

int main() {
  TestParsesDocumentTimestamp();
  TestRejectsOtherShapes();
  TestRejectsOutOfRangeYears();

  std::cout << "mlmeta_unit_time: pass\n";
  return 0;
}
