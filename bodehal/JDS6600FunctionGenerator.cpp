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
	@brief Implementation of JDS6600FunctionGenerator
 */

#include "bodehal.h"
#include "JDS6600FunctionGenerator.h"

using namespace std;

//Frequency register multipliers: Hz, kHz and MHz are display-only, mHz and uHz rescale the value
static const double g_frequencyMultipliers[] = { 1, 1, 1, 1e-3, 1e-6 };

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

JDS6600FunctionGenerator::JDS6600FunctionGenerator(SCPITransport* transport)
	: SCPIDevice(transport, false)
	, SCPIInstrument(transport, false)
	, m_maxFrequency(60e6)
{
	m_vendor = "JDS";
	m_model = "JDS6600";

	m_channels.push_back(new InstrumentChannel(this, "CH1", "#ffff00", 0));
	m_channels.push_back(new InstrumentChannel(this, "CH2", "#00ffff", 1));

	if(!m_transport->IsConnected())
		return;

	//Discard anything left over from a previous session
	m_transport->FlushRXBuffer();

	auto serial = ReadRegisterScalar(REG_SERIALNUMBER);
	if(serial)
		m_serial = to_string(*serial);

	//Device type register is the maximum frequency in MHz (e.g. 60 for a JDS6600-60M)
	auto type = ReadRegisterScalar(REG_DEVICETYPE);
	if(type && (*type > 0))
	{
		m_model = string("JDS6600-") + to_string(*type) + "M";
		m_maxFrequency = *type * 1e6;
	}
	else
		LogWarning("JDS6600: could not read device type, assuming 60 MHz maximum\n");

	LogDebug("Connected to %s (serial %s)\n", m_model.c_str(), m_serial.c_str());

	//Frequency writes are ignored while a sweep or another special mode is running
	auto mode = GetMode();
	if( (mode != MODE_WAVE_CH1) && (mode != MODE_WAVE_CH2) )
	{
		LogNotice("JDS6600 is not in waveform mode, switching to CH1 waveform mode\n");
		SetMode(MODE_WAVE_CH1);
	}
}

JDS6600FunctionGenerator::~JDS6600FunctionGenerator()
{
}

string JDS6600FunctionGenerator::GetDriverNameInternal()
{
	return "jds6600";
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Wire format

string JDS6600FunctionGenerator::FormatWrite(int reg, const string& value)
{
	char tmp[128];
	snprintf(tmp, sizeof(tmp), ":w%02d=%s.", reg, value.c_str());
	return tmp;
}

string JDS6600FunctionGenerator::FormatRead(int reg)
{
	char tmp[32];
	snprintf(tmp, sizeof(tmp), ":r%02d=0.", reg);
	return tmp;
}

/**
	@brief Parses the reply to a single register read

	@param reg		Register that was read
	@param reply	Reply line, without the trailing newline

	@return The comma separated values, or nullopt if the reply is malformed or for a different register
 */
optional< vector<int64_t> > JDS6600FunctionGenerator::ParseReadReply(int reg, const string& reply)
{
	char prefix[16];
	snprintf(prefix, sizeof(prefix), ":r%02d=", reg);
	string line = Trim(reply);
	size_t plen = strlen(prefix);
	if( (line.length() <= plen) || (line.compare(0, plen, prefix) != 0) )
		return nullopt;

	//Value is terminated by exactly one '.'
	string body = line.substr(plen);
	auto dot = body.find('.');
	if( (dot == string::npos) || (body.find('.', dot+1) != string::npos) )
		return nullopt;
	body = body.substr(0, dot);

	vector<int64_t> ret;
	for(auto& field : explode(body, ','))
	{
		if(field.empty())
			return nullopt;
		char* end = nullptr;
		long long v = strtoll(field.c_str(), &end, 10);
		if(*end != '\0')
			return nullopt;
		ret.push_back(v);
	}
	if(ret.empty())
		return nullopt;
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Register access

bool JDS6600FunctionGenerator::WriteRegister(int reg, const string& value)
{
	auto cmd = FormatWrite(reg, value);
	auto reply = Trim(m_transport->SendCommandImmediateWithReply(cmd, false));
	if(reply != ":ok")
	{
		LogError("JDS6600: write \"%s\" got \"%s\" instead of \":ok\"\n", cmd.c_str(), reply.c_str());
		return false;
	}
	return true;
}

optional< vector<int64_t> > JDS6600FunctionGenerator::ReadRegister(int reg)
{
	auto reply = m_transport->SendCommandImmediateWithReply(FormatRead(reg), false);
	auto ret = ParseReadReply(reg, reply);
	if(!ret)
		LogError("JDS6600: bad reply \"%s\" reading register %d\n", Trim(reply).c_str(), reg);
	return ret;
}

optional<int64_t> JDS6600FunctionGenerator::ReadRegisterScalar(int reg)
{
	auto v = ReadRegister(reg);
	if(!v)
		return nullopt;
	return (*v)[0];
}

bool JDS6600FunctionGenerator::ValidateChannel(int chan)
{
	if( (chan < 0) || (chan > 1) )
	{
		LogError("JDS6600: invalid channel %d\n", chan);
		return false;
	}
	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Mode control

JDS6600FunctionGenerator::Mode JDS6600FunctionGenerator::GetMode()
{
	auto raw = ReadRegisterScalar(REG_MODE);
	if(!raw)
		return MODE_UNKNOWN;

	//Mode is in the high bits when reading
	switch(*raw >> 3)
	{
		case 0:
		case 1:
			return MODE_WAVE_CH1;

		case 2:
		case 3:
			return MODE_WAVE_CH2;

		case 4:
		case 5:
			return MODE_SYSTEM;

		case 8:
			return MODE_MEASURE;

		case 9:
			return MODE_COUNTER;

		case 10:
			return MODE_SWEEP_CH1;

		case 11:
			return MODE_SWEEP_CH2;

		case 12:
			return MODE_PULSE;

		case 13:
			return MODE_BURST;

		default:
			LogWarning("JDS6600: unexpected mode register value %" PRId64 "\n", *raw);
			return MODE_UNKNOWN;
	}
}

bool JDS6600FunctionGenerator::StopAllActions()
{
	return WriteRegister(REG_ACTION, "0,0,0,0");
}

bool JDS6600FunctionGenerator::SetMode(Mode mode)
{
	//Write encoding is not the same as read encoding
	int id;
	switch(mode)
	{
		case MODE_WAVE_CH1:		id = 0;	break;
		case MODE_WAVE_CH2:		id = 1;	break;
		case MODE_SYSTEM:		id = 2;	break;
		case MODE_MEASURE:		id = 4;	break;
		case MODE_COUNTER:		id = 5;	break;
		case MODE_SWEEP_CH1:	id = 6;	break;
		case MODE_SWEEP_CH2:	id = 7;	break;
		case MODE_PULSE:		id = 8;	break;
		case MODE_BURST:		id = 9;	break;

		default:
			LogError("JDS6600: cannot select unknown mode\n");
			return false;
	}

	if(!StopAllActions())
		return false;
	return WriteRegister(REG_MODE, to_string(id));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// FunctionGenerator

vector<FunctionGenerator::WaveShape> JDS6600FunctionGenerator::GetAvailableWaveformShapes(int /*chan*/)
{
	vector<WaveShape> ret;
	ret.push_back(SHAPE_SINE);
	ret.push_back(SHAPE_SQUARE);
	ret.push_back(SHAPE_PULSE);
	ret.push_back(SHAPE_TRIANGLE);
	ret.push_back(SHAPE_DC);
	ret.push_back(SHAPE_NOISE);
	return ret;
}

bool JDS6600FunctionGenerator::GetFunctionChannelActive(int chan)
{
	if(!ValidateChannel(chan))
		return false;

	auto v = ReadRegister(REG_CHANNELENABLE);
	if(!v || (v->size() < 2))
		return false;
	return (*v)[chan] != 0;
}

bool JDS6600FunctionGenerator::SetFunctionChannelActive(int chan, bool on)
{
	if(!ValidateChannel(chan))
		return false;

	//Both channels share one register, so read-modify-write
	auto v = ReadRegister(REG_CHANNELENABLE);
	if(!v || (v->size() < 2))
		return false;
	int64_t en[2] = { (*v)[0], (*v)[1] };
	en[chan] = on ? 1 : 0;

	return WriteRegister(REG_CHANNELENABLE, to_string(en[0]) + "," + to_string(en[1]));
}

float JDS6600FunctionGenerator::GetFunctionChannelAmplitude(int chan)
{
	if(!ValidateChannel(chan))
		return NAN;

	//mV
	auto v = ReadRegisterScalar(REG_AMPLITUDE1 + chan);
	if(!v)
		return NAN;
	return *v / 1000.0f;
}

bool JDS6600FunctionGenerator::SetFunctionChannelAmplitude(int chan, float amplitude)
{
	if(!ValidateChannel(chan))
		return false;
	if( (amplitude < 0) || (amplitude > 20) )
	{
		LogError("JDS6600: amplitude %.3f V out of range (0 to 20 V)\n", amplitude);
		return false;
	}

	return WriteRegister(REG_AMPLITUDE1 + chan, to_string(lround(amplitude * 1000)));
}

float JDS6600FunctionGenerator::GetFunctionChannelOffset(int chan)
{
	if(!ValidateChannel(chan))
		return NAN;

	//10 mV steps, biased by 1000
	auto v = ReadRegisterScalar(REG_OFFSET1 + chan);
	if(!v)
		return NAN;
	return (*v - 1000) / 100.0f;
}

bool JDS6600FunctionGenerator::SetFunctionChannelOffset(int chan, float offset)
{
	if(!ValidateChannel(chan))
		return false;
	if( (offset < -10) || (offset > 10) )
	{
		LogError("JDS6600: offset %.3f V out of range (-10 to 10 V)\n", offset);
		return false;
	}

	return WriteRegister(REG_OFFSET1 + chan, to_string(lround(offset * 100) + 1000));
}

float JDS6600FunctionGenerator::GetFunctionChannelFrequency(int chan)
{
	if(!ValidateChannel(chan))
		return NAN;

	auto v = ReadRegister(REG_FREQUENCY1 + chan);
	if(!v || (v->size() < 2))
		return NAN;

	int64_t mult = (*v)[1];
	if( (mult < 0) || (mult > 4) )
	{
		LogError("JDS6600: unexpected frequency multiplier %" PRId64 "\n", mult);
		return NAN;
	}
	return (*v)[0] / 100.0 * g_frequencyMultipliers[mult];
}

bool JDS6600FunctionGenerator::SetFunctionChannelFrequency(int chan, float hz)
{
	if(!ValidateChannel(chan))
		return false;

	//Always use the Hz multiplier, good to 60 MHz in 10 mHz steps
	if( (hz < 0) || (hz > 60e6) )
	{
		LogError("JDS6600: frequency %s out of range\n", Unit(Unit::UNIT_HZ).PrettyPrint(hz).c_str());
		return false;
	}

	return WriteRegister(REG_FREQUENCY1 + chan, to_string(llround(hz * 100.0)) + ",0");
}

FunctionGenerator::WaveShape JDS6600FunctionGenerator::GetFunctionChannelShape(int chan)
{
	if(!ValidateChannel(chan))
		return SHAPE_UNKNOWN;

	auto v = ReadRegisterScalar(REG_WAVEFORM1 + chan);
	if(!v)
		return SHAPE_UNKNOWN;

	switch(*v)
	{
		case 0:
			return SHAPE_SINE;
		case 1:
			return SHAPE_SQUARE;
		case 2:
			return SHAPE_PULSE;
		case 3:
			return SHAPE_TRIANGLE;
		case 6:
			return SHAPE_DC;
		case 11:
			return SHAPE_NOISE;

		//101 and up are arbitrary waveform slots
		default:
			if(*v >= 101)
				return SHAPE_ARB;
			return SHAPE_UNKNOWN;
	}
}

bool JDS6600FunctionGenerator::SetFunctionChannelShape(int chan, WaveShape shape)
{
	if(!ValidateChannel(chan))
		return false;

	int code;
	switch(shape)
	{
		case SHAPE_SINE:		code = 0;	break;
		case SHAPE_SQUARE:		code = 1;	break;
		case SHAPE_PULSE:		code = 2;	break;
		case SHAPE_TRIANGLE:	code = 3;	break;
		case SHAPE_DC:			code = 6;	break;
		case SHAPE_NOISE:		code = 11;	break;

		default:
			LogError("JDS6600: unsupported waveform shape %s\n", GetNameOfShape(shape).c_str());
			return false;
	}

	return WriteRegister(REG_WAVEFORM1 + chan, to_string(code));
}

float JDS6600FunctionGenerator::GetFunctionChannelMaxFrequency(int /*chan*/)
{
	return m_maxFrequency;
}
