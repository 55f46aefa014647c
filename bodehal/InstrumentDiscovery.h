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
	@brief Declaration of InstrumentDiscovery
 */

#ifndef InstrumentDiscovery_h
#define InstrumentDiscovery_h

/**
	@brief Finds instruments on the local network

	The sweep never depends on discovery: it only runs when no explicit scope address was given.
 */
class InstrumentDiscovery
{
public:
	InstrumentDiscovery();
	virtual ~InstrumentDiscovery();

	struct DiscoveredInstrument
	{
		///@brief IP address of the instrument
		std::string m_address;

		///@brief Identification string, usually the *IDN? reply
		std::string m_id;
	};

	/**
		@brief Looks for instruments

		@param timeoutMs	How long to wait for replies, in milliseconds
	 */
	virtual std::vector<DiscoveredInstrument> Discover(unsigned int timeoutMs) =0;

	std::optional<std::string> FindOscilloscope(unsigned int timeoutMs);

	static std::unique_ptr<InstrumentDiscovery> CreateDefault();
};

#ifdef HAS_LXI

/**
	@brief VXI-11 broadcast discovery through liblxi
 */
class LxiInstrumentDiscovery : public InstrumentDiscovery
{
public:
	LxiInstrumentDiscovery();
	virtual ~LxiInstrumentDiscovery();

	virtual std::vector<DiscoveredInstrument> Discover(unsigned int timeoutMs) override;

protected:
	static void OnBroadcast(const char* address, const char* interface);
	static void OnDevice(const char* address, const char* id);

	static bool m_lxi_initialized;

	//liblxi callbacks carry no context pointer
	static std::mutex m_resultsMutex;
	static std::vector<DiscoveredInstrument> m_results;
};

#endif

#endif
