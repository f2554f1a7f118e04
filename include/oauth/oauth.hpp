#pragma once

// Public entry point: core types, configuration, authenticators, dispatcher and HTTP front end
#include "broker/broker.hpp"
