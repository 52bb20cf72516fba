#include <iostream>
#include <exception>
#include "test_env.hpp"
// Only GTest::gtest is linked, not gtest_main, so the smoke harness below runs
// first and GoogleTest is dispatched explicitly afterwards.
#include <gtest/gtest.h>

void run_env_smoke_test();
void run_diagnostics_json_smoke_test();
void run_jit_smoke_test();

int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    // Test discovery only lists tests; keep stdout clean for it.
    if(!GTEST_FLAG_GET(list_tests)){
        try{
            run_env_smoke_test();
            run_diagnostics_json_smoke_test();
            // End-to-end: build, compile, link and call one transition function
            run_jit_smoke_test();
        }catch(const std::exception& e){ std::cerr << "[ndca] exception: " << e.what() << "\n"; return 1; }
    }
    return RUN_ALL_TESTS();
}
