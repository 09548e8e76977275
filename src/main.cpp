#include "app/GpsApp.hpp"


int main(int argc, char* argv[]) {
    return runApp(argc, argv);
}
