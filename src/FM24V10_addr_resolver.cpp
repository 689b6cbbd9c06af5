/**
 * This file is part of emb-lin-fram, a userspace driver for I2C F-RAM on embedded linux.
 * 
 * This software is distrubuted in the hope it will be useful, but without any warranty, including the implied warrranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See LICENSE.txt for details.
 * 
 * @author Jacob Schloss <jacob.schloss@suburbanmarine.io>
 * @copyright Copyright (c) 2025 Suburban Marine, Inc. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-fram/FM24V10_addr_resolver.hpp"

#include <algorithm>

bool FM24V10_plan::next(FM24V10_trx* const out_trx)
{
	if(m_remaining == 0)
	{
		return false;
	}

	const size_t bank       = m_addr / FM24V10_addr_resolver::BANK_SIZE;
	const size_t bank_local = m_addr % FM24V10_addr_resolver::BANK_SIZE;
	const size_t chunk      = std::min(m_remaining, FM24V10_addr_resolver::BANK_SIZE - bank_local);

	out_trx->slave_addr = m_base_addr | uint8_t(bank & 0x01U);
	out_trx->mem_addr   = uint16_t(bank_local);
	out_trx->size       = chunk;
	out_trx->dir        = m_dir;

	m_addr      += chunk;
	m_remaining -= chunk;

	return true;
}

FM24V10_addr_resolver::FM24V10_addr_resolver(const FM24V10_addr_pins& pins)
{
	m_base_addr = (DEVICE_TYPE_CODE << 3) | (pins.get_sel_bits() << 1);
}

FRAM_status FM24V10_addr_resolver::plan(const size_t addr, const size_t size, const FM24V10_trx::DIR dir, FM24V10_plan* const out_plan) const
{
	if( ! is_valid_span(addr, size) )
	{
		return FRAM_status::out_of_range();
	}

	*out_plan = FM24V10_plan(m_base_addr, addr, size, dir);

	return FRAM_status::ok();
}

FRAM_status FM24V10_addr_resolver::plan(const size_t addr, const size_t size, const FM24V10_trx::DIR dir, std::vector<FM24V10_trx>* const out_trx) const
{
	out_trx->clear();

	FM24V10_plan trx_plan;
	const FRAM_status ret = plan(addr, size, dir, &trx_plan);
	if( ! ret )
	{
		return ret;
	}

	// at most one transaction per bank
	out_trx->reserve(NUM_BANKS);

	FM24V10_trx trx;
	while(trx_plan.next(&trx))
	{
		out_trx->push_back(trx);
	}

	return FRAM_status::ok();
}
