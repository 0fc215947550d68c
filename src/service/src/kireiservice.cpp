/**
 * @file kireiservice.cpp
 * @brief Точка входа kirei_service
 */

#include "../include/service_controller.hpp"

int main(int argc, char **argv) {
  kirei::ServiceController controller;
  return controller.run(argc, argv);
}
