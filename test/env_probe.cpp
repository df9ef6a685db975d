// Child process used by test_cli: prints one environment variable.
#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: env_probe <NAME>\n";
        return 3;
    }
    const char* value = std::getenv(argv[1]);
    if (!value) {
        std::cerr << "missing env " << argv[1] << "\n";
        return 2;
    }
    std::cout << value << "\n";
    return 0;
}
