/***********************************************************************************************************************
*                                                                                                                      *
* libbodehal                                                                                                           *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Main library include file
 */

#ifndef bodehal_h
#define bodehal_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <list>
#include <set>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <stdint.h>
#include <inttypes.h>
#include <stdio.h>
#include <time.h>
#include <chrono>
#include <thread>
#include <memory>
#include <climits>
#include <float.h>
#include <math.h>
#include <string.h>
#include <ctype.h>

#include <sigc++/sigc++.h>
#include <yaml-cpp/yaml.h>

#include <log/log.h>

#include "config.h"

#define FS_PER_NANOSECOND 1e6
#define FS_PER_MICROSECOND 1e9
#define FS_PER_SECOND 1e15
#define SECONDS_PER_FS 1e-15

#include "Unit.h"
#include "BodeException.h"

#include "SCPITransport.h"
#include "SCPISocketTransport.h"
#include "SCPIUARTTransport.h"
#include "SCPIDevice.h"

#include "InstrumentChannel.h"
#include "Instrument.h"
#include "SCPIInstrument.h"
#include "Waveform.h"
#include "FunctionGenerator.h"
#include "Oscilloscope.h"

#include "InstrumentDiscovery.h"

#include "SweepConfiguration.h"
#include "MeasurementExtractor.h"
#include "SignalSourceController.h"
#include "CaptureController.h"
#include "FrequencySweep.h"
#include "SavitzkyGolayFilter.h"

std::string Trim(const std::string& str);
std::string to_string_sci(double d);
std::vector<std::string> explode(const std::string& str, char separator);
double GetTime();

void TransportStaticInit();
void DriverStaticInit();

#endif
