/**
 * @file main.cpp
 * @brief Entry point for the dreadloom director.
 */

#include "app/DirectorApp.hpp"

int main(int argc, char** argv) {
    dreadloom::app::DirectorApp app;
    return app.Run(argc, argv);
}
