#include <jsonv/jsonv.hpp>

#include <iostream>

void test_scanner();
void test_strings();
void test_numbers();
void test_validators();
void test_schema();
void test_structure();
void test_slice();
void test_parser();
void test_errors();
void test_random();

int main() {
  // prepare failures are expected in several tests and logged as warnings
  jsonv::logging::set_level(spdlog::level::err);

  test_scanner();
  test_strings();
  test_numbers();
  test_validators();
  test_schema();
  test_structure();
  test_slice();
  test_parser();
  test_errors();
  test_random();

  std::cout << "jsonv tests passed\n";
  return 0;
}
