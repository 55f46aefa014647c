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
	@brief Implementation of FunctionGenerator
 */

#include "bodehal.h"

using namespace std;

FunctionGenerator::GeneratorCreateMapType FunctionGenerator::m_generatorcreateprocs;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

FunctionGenerator::FunctionGenerator()
{
}

FunctionGenerator::~FunctionGenerator()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Driver enumeration

void FunctionGenerator::DoAddDriverClass(string name, GeneratorCreateProcType proc)
{
	m_generatorcreateprocs[name] = proc;
}

FunctionGenerator* FunctionGenerator::CreateFunctionGenerator(string driver, SCPITransport* transport)
{
	if(m_generatorcreateprocs.find(driver) != m_generatorcreateprocs.end())
		return m_generatorcreateprocs[driver](transport);

	LogError("Invalid function generator driver name \"%s\"\n", driver.c_str());
	return nullptr;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Default implementations of optional features

float FunctionGenerator::GetFunctionChannelMaxFrequency(int /*chan*/)
{
	return FLT_MAX;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Shape names

string FunctionGenerator::GetNameOfShape(WaveShape shape)
{
	switch(shape)
	{
		case SHAPE_SINE:
			return "Sine";

		case SHAPE_SQUARE:
			return "Square";

		case SHAPE_TRIANGLE:
			return "Triangle";

		case SHAPE_PULSE:
			return "Pulse";

		case SHAPE_DC:
			return "DC";

		case SHAPE_NOISE:
			return "Noise";

		case SHAPE_SAWTOOTH_UP:
			return "Sawtooth up";

		case SHAPE_SAWTOOTH_DOWN:
			return "Sawtooth down";

		case SHAPE_ARB:
			return "Arbitrary";

		default:
			return "Unknown";
	}
}
