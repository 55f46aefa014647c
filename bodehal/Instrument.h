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
	@brief Declaration of Instrument
 */

#ifndef Instrument_h
#define Instrument_h

/**
	@brief An arbitrary lab instrument: here an oscilloscope or a function generator

	All channels regardless of type occupy a single zero-based namespace.
 */
class Instrument
{
public:
	Instrument();
	virtual ~Instrument();

	/*
		@brief Types of instrument.

		Note that we can't use RTTI for this because a single driver may implement more than one type.
	 */
	enum InstrumentTypes
	{
		//An oscilloscope or logic analyzer
		INST_OSCILLOSCOPE 		=  0x01,

		//A function generator
		INST_FUNCTION			=  0x08
	};

	/**
		@brief Returns a bitfield describing the set of instrument types that this instrument supports.
	 */
	virtual unsigned int GetInstrumentTypes() const =0;

	//Device information
	virtual std::string GetName() const =0;
	virtual std::string GetVendor() const =0;
	virtual std::string GetSerial() const =0;
	virtual std::string GetDriverName() const =0;

	/**
		@brief Optional user-selected nickname of the instrument
	 */
	std::string m_nickname;

	/**
		@brief Gets the connection string for our transport
	 */
	virtual std::string GetTransportConnectionString() =0;

	/**
		@brief Gets the name of our transport
	 */
	virtual std::string GetTransportName() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Channel enumeration and identification

	/**
		@brief Gets the number of channels (of any type) this instrument has.
	 */
	size_t GetChannelCount() const
	{ return m_channels.size(); }

	/**
		@brief Gets a given channel on the instrument
	 */
	InstrumentChannel* GetChannel(size_t i) const
	{
		if(i < m_channels.size())
			return m_channels[i];
		else
			return nullptr;
	}

protected:

	/**
		@brief Set of all channels on this instrument
	 */
	std::vector<InstrumentChannel*> m_channels;
};

#endif
