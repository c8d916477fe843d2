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
	@brief Declaration of TriggerPool and InternalTrigger
 */

#ifndef TriggerPool_h
#define TriggerPool_h

class TriggerPool;

/**
	@brief Lease on one internal trigger of an instrument

	Move-only. The trigger goes back to its pool when Release() is called or the lease is destroyed, whichever comes
	first. A lease issued before TriggerPool::Reset() is stale: it reports itself invalid and releasing it does nothing,
	so it can never fire, route or return a number that has since been handed out again.

	The pool must outlive every lease taken from it.
 */
class InternalTrigger
{
public:
	InternalTrigger();
	InternalTrigger(InternalTrigger&& rhs);
	InternalTrigger& operator=(InternalTrigger&& rhs);
	~InternalTrigger();

	InternalTrigger(const InternalTrigger&) =delete;
	InternalTrigger& operator=(const InternalTrigger&) =delete;

	///@brief Gets the trigger number (1-based), as used in "int<N>" and "tint <N>"
	int GetValue() const
	{ return m_value; }

	bool IsValid() const;

	void Release();

protected:
	friend class TriggerPool;
	InternalTrigger(TriggerPool* pool, int value, uint64_t generation);

	TriggerPool* m_pool;
	int m_value;
	uint64_t m_generation;
};

/**
	@brief Fixed set of internal trigger numbers of one instrument

	Pure bookkeeping: nothing in here talks to hardware. Allocation always hands out the lowest free number.
 */
class TriggerPool
{
public:
	TriggerPool(int size = 16);

	InternalTrigger Allocate();
	void Release(int value);
	void Reset();

	size_t GetFreeCount() const;
	bool IsFree(int value) const;
	uint64_t GetGeneration() const;

	///@brief Number of triggers managed by the pool
	int GetSize() const
	{ return m_size; }

protected:
	friend class InternalTrigger;
	void ReleaseLease(int value, uint64_t generation);
	void DoRelease(int value);

	int m_size;

	///@brief Generation counter, bumped by Reset()
	uint64_t m_generation;

	///@brief Trigger numbers that are not currently leased
	std::set<int> m_free;

	mutable std::mutex m_mutex;
};

#endif
