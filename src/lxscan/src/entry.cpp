#include "main.h"

int main(int argc, char const *const *argv) {
    return lxscan_main(argc, argv);
}
