/***********************************************************************************************************************
*                                                                                                                      *
* libgatehal                                                                                                           *
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
	@brief Main library include file
 */

#ifndef gatehal_h
#define gatehal_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <list>
#include <stdint.h>
#include <chrono>
#include <thread>
#include <memory>
#include <mutex>
#include <climits>
#include <set>
#include <stdexcept>
#include <float.h>
#include <limits>
#include <algorithm>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log.h>

#include "GatehalErrors.h"
#include "Unit.h"

#include "SCPITransport.h"
#include "SCPINullTransport.h"
#include "SCPIRequest.h"

#include "InstrumentChannel.h"
#include "Instrument.h"
#include "SCPIInstrument.h"

#include "TriggerPool.h"
#include "ArrangementConfig.h"
#include "QDAC2Channel.h"
#include "QDAC2.h"

#include "ContactArrangement.h"
#include "VirtualGateArrangement.h"
#include "SweepGenerator.h"
#include "VirtualSweep.h"
#include "LeakageCharacterizer.h"

#include "QDAC2Array.h"
#include "ArrayArrangement.h"

std::string Trim(const std::string& str);
std::vector<std::string> explode(const std::string& str, char separator);

std::string to_string_scpi(double d);
std::string FormatValueList(const std::vector<double>& values);
std::string FormatChannelList(const std::vector<int>& channels);
std::vector<double> ParseValueList(const std::string& str);

#endif
