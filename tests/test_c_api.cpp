// SPDX-License-Identifier: MIT

#include "qrecon/c_api.h"
#include <cstring>
#include <iostream>
#include <string>

static int tests_failed = 0;
#define EXPECT_TRUE(x) do{ if (!(x)) { std::cerr << "EXPECT_TRUE failed at " << __LINE__ << ": " #x "\n"; ++tests_failed; } }while(0)

int main(){
  char* out = nullptr;
  int rc = qrecon_run(nullptr, &out);
  EXPECT_TRUE(rc == 0 && out);
  std::string js(out ? out : "");
  qrecon_free(out);
  EXPECT_TRUE(js.find("\"art_recon\"") != std::string::npos);
  EXPECT_TRUE(js.find("\"eigenvalues\"") != std::string::npos);

  rc = qrecon_run("{\"iterations\": 3, \"inversion\": \"grid\", \"shots\": 16}", &out);
  EXPECT_TRUE(rc == 0);
  qrecon_free(out);

  // empty eigenvalue table
  rc = qrecon_run("{\"table\": \"\"}", &out);
  EXPECT_TRUE(rc == 6 && out == nullptr);
  EXPECT_TRUE(std::strlen(qrecon_last_error()) > 0);

  rc = qrecon_run("{\"pixel_order\": \"0,1,2\"}", &out);
  EXPECT_TRUE(rc == 7);

  rc = qrecon_run("{\"uncovered\": \"sometimes\"}", &out);
  EXPECT_TRUE(rc == 3);

  rc = qrecon_run("{}", nullptr);
  EXPECT_TRUE(rc == 2);

  EXPECT_TRUE(std::strlen(qrecon_version()) > 0);
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
