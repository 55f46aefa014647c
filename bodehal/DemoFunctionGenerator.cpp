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
	@brief Implementation of DemoFunctionGenerator
 */

#include "bodehal.h"
#include "DemoFunctionGenerator.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

DemoFunctionGenerator::DemoFunctionGenerator()
	: m_frequencyChanges(0)
{
	m_channels.push_back(new InstrumentChannel(this, "CH1", "#ffff00", 0));
	m_channels.push_back(new InstrumentChannel(this, "CH2", "#00ffff", 1));

	for(int i=0; i<2; i++)
	{
		m_active[i] = false;
		m_amplitude[i] = 1;
		m_offset[i] = 0;
		m_frequency[i] = 1000;
		m_shape[i] = SHAPE_SINE;
	}
}

DemoFunctionGenerator::~DemoFunctionGenerator()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Information queries

string DemoFunctionGenerator::GetDriverNameInternal()
{
	return "demo";
}

string DemoFunctionGenerator::GetName() const
{
	return "Function Generator Simulator";
}

string DemoFunctionGenerator::GetVendor() const
{
	return "Antikernel Labs";
}

string DemoFunctionGenerator::GetSerial() const
{
	return "12345";
}

string DemoFunctionGenerator::GetTransportConnectionString()
{
	return "";
}

string DemoFunctionGenerator::GetTransportName()
{
	return "null";
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// FunctionGenerator

vector<FunctionGenerator::WaveShape> DemoFunctionGenerator::GetAvailableWaveformShapes(int /*chan*/)
{
	vector<WaveShape> ret;
	ret.push_back(SHAPE_SINE);
	return ret;
}

bool DemoFunctionGenerator::GetFunctionChannelActive(int chan)
{
	return m_active[chan];
}

bool DemoFunctionGenerator::SetFunctionChannelActive(int chan, bool on)
{
	m_active[chan] = on;
	return true;
}

float DemoFunctionGenerator::GetFunctionChannelAmplitude(int chan)
{
	return m_amplitude[chan];
}

bool DemoFunctionGenerator::SetFunctionChannelAmplitude(int chan, float amplitude)
{
	m_amplitude[chan] = amplitude;
	return true;
}

float DemoFunctionGenerator::GetFunctionChannelOffset(int chan)
{
	return m_offset[chan];
}

bool DemoFunctionGenerator::SetFunctionChannelOffset(int chan, float offset)
{
	m_offset[chan] = offset;
	return true;
}

float DemoFunctionGenerator::GetFunctionChannelFrequency(int chan)
{
	return m_frequency[chan];
}

bool DemoFunctionGenerator::SetFunctionChannelFrequency(int chan, float hz)
{
	m_frequency[chan] = hz;
	m_frequencyChanges ++;
	return true;
}

FunctionGenerator::WaveShape DemoFunctionGenerator::GetFunctionChannelShape(int chan)
{
	return m_shape[chan];
}

bool DemoFunctionGenerator::SetFunctionChannelShape(int chan, WaveShape shape)
{
	//Only sine is simulated
	if(shape != SHAPE_SINE)
	{
		LogError("Demo generator only supports sine output\n");
		return false;
	}
	m_shape[chan] = shape;
	return true;
}

float DemoFunctionGenerator::GetFunctionChannelMaxFrequency(int /*chan*/)
{
	return 60e6;
}
