#include "inode_table.hpp"

InodeTable::InodeTable(bool forget_delivery_reliable)
	: forget_delivery_reliable_(forget_delivery_reliable),
	  mutex_([this] { check_invariants(); })
{
	inodes_.try_emplace(kRootInodeId, InodeAttributes{.nlink = 1, .mode = kDirMode});
	inodes_.try_emplace(kFooInodeId, InodeAttributes{.nlink = 1, .mode = kFileMode});
	inodes_.try_emplace(kBarInodeId, InodeAttributes{.nlink = 1, .mode = kDirMode});

	// The kernel holds a reference to the root from the moment of mounting.
	inodes_.at(kRootInodeId).increment_lookup_count();
}

void InodeTable::check_invariants() const
{
	for (const auto &[id, inode] : inodes_)
	{
		if (id >= next_inode_id_)
		{
			error_print("INTERNAL ERROR: Unexpectedly large inode ID {} (next {})", id,
						next_inode_id_);
			abort();
		}
	}
}

Inode &InodeTable::find_inode(InodeId id)
{
	auto it = inodes_.find(id);
	if (it == inodes_.end())
	{
		error_print("INTERNAL ERROR: Unknown inode {}", id);
		abort();
	}

	if (it->second.forgotten())
	{
		error_print("INTERNAL ERROR: Forgotten inode {}", id);
		abort();
	}

	return it->second;
}

std::pair<InodeId, Inode &> InodeTable::mint_inode(const InodeAttributes &attrs)
{
	InodeId id = next_inode_id_++;
	auto [it, inserted] = inodes_.try_emplace(id, attrs);
	if (!inserted)
	{
		error_print("INTERNAL ERROR: Inode ID {} minted twice", id);
		abort();
	}

	it->second.increment_lookup_count();
	return {id, it->second};
}

void InodeTable::check()
{
	std::lock_guard<InvariantMutex> g{mutex_};

	// On Linux forgets for live inodes are often not delivered at unmount and
	// destroy is never received, so there is nothing meaningful to verify.
	if (!forget_delivery_reliable_)
	{
		debug_print("check: forget delivery unreliable, skipping");
		return;
	}

	for (const auto &[id, inode] : inodes_)
	{
		// The root need not reach zero since forgets for it are not always
		// sent, but it must never exceed one.
		if (id == kRootInodeId)
		{
			if (inode.lookup_count > 1)
			{
				error_print("INTERNAL ERROR: Root has lookup count {}", inode.lookup_count);
				abort();
			}
			continue;
		}

		if (inode.lookup_count != 0)
		{
			error_print("INTERNAL ERROR: Inode {} has lookup count {}", id, inode.lookup_count);
			abort();
		}
	}

	debug_print("check: {} inodes drained", inodes_.size());
}

uint64_t InodeTable::lookup_count(InodeId id)
{
	std::lock_guard<InvariantMutex> g{mutex_};
	auto it = inodes_.find(id);
	if (it == inodes_.end())
	{
		error_print("INTERNAL ERROR: Unknown inode {}", id);
		abort();
	}
	return it->second.lookup_count;
}

InodeId InodeTable::next_inode_id()
{
	std::lock_guard<InvariantMutex> g{mutex_};
	return next_inode_id_;
}
