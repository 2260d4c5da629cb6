#include <iostream>

// Bundled language test entry points
void run_pylite_tests();
void run_curlite_tests();

int main(){
    run_pylite_tests();
    run_curlite_tests();
    std::cout << "[languages] All language tests passed\n";
    return 0;
}
