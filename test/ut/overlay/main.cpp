//=============================================================================
// yoverlay Tests - Main Entry Point
//=============================================================================

#include <boost/ut.hpp>

int main() {
    return boost::ut::cfg<>.run();
}
