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
	@brief Declaration of InstrumentChannel
 */

#ifndef InstrumentChannel_h
#define InstrumentChannel_h

class Instrument;

/**
	@brief A single channel of an instrument

	A "channel" refers to a single physical connector on the front panel of the device: an oscilloscope input or a
	function generator output.
 */
class InstrumentChannel
{
public:
	InstrumentChannel(
		Instrument* inst,
		const std::string& hwname,
		const std::string& color = "#808080",
		size_t index = 0);

	virtual ~InstrumentChannel();

	///Display color (HTML hex notation: #RRGGBB)
	std::string m_displaycolor;

	///@brief Gets the hardware name of the channel (m_hwname)
	std::string GetHwname() const
	{ return m_hwname; }

	///@brief Gets the (zero based) index of the channel
	size_t GetIndex() const
	{ return m_index; }

	///@brief Gets the instrument this channel is part of
	Instrument* GetInstrument()
	{ return m_instrument; }

protected:

	///@brief The instrument we're part of
	Instrument* m_instrument;

	///@brief Hardware name as labeled on the instrument and used in commands
	std::string m_hwname;

	///@brief Channel index within the instrument
	size_t m_index;
};

#endif
