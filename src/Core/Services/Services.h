#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "ILogger.h"
#include "IIO.h"
#include "IMqtt.h"
