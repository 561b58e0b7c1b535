#pragma once

namespace paycore::tests {

void test_format_amount();
void test_account_writer();

}  // namespace paycore::tests
