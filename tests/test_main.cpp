#include "test_framework.h"

int main() {
    return test::run_all();
}
