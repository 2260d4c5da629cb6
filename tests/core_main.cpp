#include <iostream>

// Kernel test entry points
void run_edn_tests();
void run_tokenizer_tests();
void run_structure_tests();
void run_env_tests();
void run_selector_tests();
void run_extern_tests();
void run_parser_tests();
void run_canon_tests();
void run_diagnostics_tests();

int main(){
    run_edn_tests();
    run_tokenizer_tests();
    run_structure_tests();
    run_env_tests();
    run_selector_tests();
    run_extern_tests();
    run_parser_tests();
    run_canon_tests();
    run_diagnostics_tests();
    std::cout << "[core] All kernel tests passed\n";
    return 0;
}
