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
	@brief Implementation of TriggerPool and InternalTrigger
 */

#include "gatehal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// InternalTrigger

InternalTrigger::InternalTrigger()
	: m_pool(nullptr)
	, m_value(0)
	, m_generation(0)
{
}

InternalTrigger::InternalTrigger(TriggerPool* pool, int value, uint64_t generation)
	: m_pool(pool)
	, m_value(value)
	, m_generation(generation)
{
}

InternalTrigger::InternalTrigger(InternalTrigger&& rhs)
	: m_pool(rhs.m_pool)
	, m_value(rhs.m_value)
	, m_generation(rhs.m_generation)
{
	rhs.m_pool = nullptr;
	rhs.m_value = 0;
}

InternalTrigger& InternalTrigger::operator=(InternalTrigger&& rhs)
{
	if(this != &rhs)
	{
		Release();

		m_pool = rhs.m_pool;
		m_value = rhs.m_value;
		m_generation = rhs.m_generation;

		rhs.m_pool = nullptr;
		rhs.m_value = 0;
	}
	return *this;
}

InternalTrigger::~InternalTrigger()
{
	Release();
}

/**
	@brief True if this lease still holds a trigger, i.e. it was neither released nor issued before a pool reset
 */
bool InternalTrigger::IsValid() const
{
	if(m_pool == nullptr)
		return false;
	return m_generation == m_pool->GetGeneration();
}

/**
	@brief Returns the trigger to its pool. Calling this more than once is harmless.
 */
void InternalTrigger::Release()
{
	if(m_pool == nullptr)
		return;

	m_pool->ReleaseLease(m_value, m_generation);
	m_pool = nullptr;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// TriggerPool

TriggerPool::TriggerPool(int size)
	: m_size(size)
	, m_generation(0)
{
	if(size < 1)
		throw InvalidValueError("Trigger pool needs at least one trigger, got " + to_string(size));

	for(int i=1; i<=m_size; i++)
		m_free.insert(i);
}

/**
	@brief Takes the lowest free trigger out of the pool

	@throw ResourceExhaustedError if every trigger is in use
 */
InternalTrigger TriggerPool::Allocate()
{
	lock_guard<mutex> lock(m_mutex);

	if(m_free.empty())
		throw ResourceExhaustedError("All " + to_string(m_size) + " internal triggers are in use");

	int value = *m_free.begin();
	m_free.erase(m_free.begin());

	LogTrace("Allocated internal trigger %d (%zu left)\n", value, m_free.size());
	return InternalTrigger(this, value, m_generation);
}

/**
	@brief Returns a trigger number to the pool. Releasing a trigger that is already free does nothing.

	@throw InvalidValueError if the number is not part of this pool
 */
void TriggerPool::Release(int value)
{
	lock_guard<mutex> lock(m_mutex);
	DoRelease(value);
}

void TriggerPool::ReleaseLease(int value, uint64_t generation)
{
	lock_guard<mutex> lock(m_mutex);

	//Lease predates the last reset, the number may belong to someone else by now
	if(generation != m_generation)
	{
		LogTrace("Ignoring release of stale internal trigger %d\n", value);
		return;
	}

	DoRelease(value);
}

void TriggerPool::DoRelease(int value)
{
	if( (value < 1) || (value > m_size) )
		throw InvalidValueError("Internal trigger " + to_string(value) + " is out of range 1.." + to_string(m_size));

	if(m_free.insert(value).second)
		LogTrace("Released internal trigger %d (%zu free)\n", value, m_free.size());
}

/**
	@brief Makes every trigger free again and invalidates all leases handed out so far
 */
void TriggerPool::Reset()
{
	lock_guard<mutex> lock(m_mutex);

	m_generation ++;
	m_free.clear();
	for(int i=1; i<=m_size; i++)
		m_free.insert(i);
}

size_t TriggerPool::GetFreeCount() const
{
	lock_guard<mutex> lock(m_mutex);
	return m_free.size();
}

///@brief Gets the generation counter, bumped by every Reset()
uint64_t TriggerPool::GetGeneration() const
{
	lock_guard<mutex> lock(m_mutex);
	return m_generation;
}

bool TriggerPool::IsFree(int value) const
{
	lock_guard<mutex> lock(m_mutex);
	return m_free.find(value) != m_free.end();
}
