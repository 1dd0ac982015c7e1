#include "controller/Controller.h"

Controller::Controller() = default;

Controller::~Controller() = default;
