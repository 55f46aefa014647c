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
	@author Tom Verbeure
	@brief Implementation of InstrumentDiscovery
 */

#include "bodehal.h"

#ifdef HAS_LXI
extern "C"
{
#include <lxi.h>
}
#endif

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// InstrumentDiscovery

InstrumentDiscovery::InstrumentDiscovery()
{
}

InstrumentDiscovery::~InstrumentDiscovery()
{
}

/**
	@brief Returns the discovery mechanism available in this build, or nullptr if there is none
 */
unique_ptr<InstrumentDiscovery> InstrumentDiscovery::CreateDefault()
{
#ifdef HAS_LXI
	return make_unique<LxiInstrumentDiscovery>();
#else
	return nullptr;
#endif
}

/**
	@brief Picks the oscilloscope to use among the discovered instruments

	A Rigol instrument is preferred, otherwise the first instrument found is used.

	@return Address of the instrument, or nullopt if nothing answered
 */
optional<string> InstrumentDiscovery::FindOscilloscope(unsigned int timeoutMs)
{
	LogVerbose("Searching for instruments (%u ms)\n", timeoutMs);
	LogIndenter li;

	auto found = Discover(timeoutMs);
	if(found.empty())
	{
		LogWarning("No instruments found\n");
		return nullopt;
	}

	for(auto& inst : found)
		LogVerbose("%s: %s\n", inst.m_address.c_str(), inst.m_id.c_str());

	for(auto& inst : found)
	{
		string id = inst.m_id;
		for(auto& c : id)
			c = toupper(c);
		if(id.find("RIGOL") != string::npos)
			return inst.m_address;
	}

	LogWarning("No Rigol instrument found, using %s\n", found[0].m_address.c_str());
	return found[0].m_address;
}

#ifdef HAS_LXI

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// LxiInstrumentDiscovery

bool LxiInstrumentDiscovery::m_lxi_initialized = false;
mutex LxiInstrumentDiscovery::m_resultsMutex;
vector<InstrumentDiscovery::DiscoveredInstrument> LxiInstrumentDiscovery::m_results;

LxiInstrumentDiscovery::LxiInstrumentDiscovery()
{
	if(!m_lxi_initialized)
	{
		lxi_init();
		m_lxi_initialized = true;
	}
}

LxiInstrumentDiscovery::~LxiInstrumentDiscovery()
{
}

void LxiInstrumentDiscovery::OnBroadcast(const char* address, const char* interface)
{
	LogDebug("Broadcasting on %s (%s)\n", interface, address);
}

void LxiInstrumentDiscovery::OnDevice(const char* address, const char* id)
{
	lock_guard<mutex> lock(m_resultsMutex);
	DiscoveredInstrument inst;
	inst.m_address = address;
	inst.m_id = id;
	m_results.push_back(inst);
}

vector<InstrumentDiscovery::DiscoveredInstrument> LxiInstrumentDiscovery::Discover(unsigned int timeoutMs)
{
	{
		lock_guard<mutex> lock(m_resultsMutex);
		m_results.clear();
	}

	lxi_info_t info;
	memset(&info, 0, sizeof(info));
	info.broadcast = &OnBroadcast;
	info.device = &OnDevice;

	if(lxi_discover(&info, timeoutMs, DISCOVER_VXI11) != LXI_OK)
		LogWarning("VXI-11 discovery failed\n");

	lock_guard<mutex> lock(m_resultsMutex);
	return m_results;
}

#endif
