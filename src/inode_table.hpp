#pragma once
#include <unordered_map>
#include "common.hpp"
#include "inode.hpp"
#include "invariant_mutex.hpp"

constexpr InodeId kFooInodeId = kRootInodeId + 1;
constexpr InodeId kBarInodeId = kRootInodeId + 2;
constexpr InodeId kFirstMintedInodeId = kRootInodeId + 3;

constexpr mode_t kFileMode = S_IFREG | 0777;
constexpr mode_t kDirMode = S_IFDIR | 0777;

using InodeMap = std::unordered_map<InodeId, Inode>;

class InodeTable
{
public:
	// forget_delivery_reliable selects whether check() enforces drained
	// lookup counts or does nothing.
	explicit InodeTable(bool forget_delivery_reliable);
	InodeTable(const InodeTable &) = delete;
	InodeTable &operator=(const InodeTable &) = delete;

	InvariantMutex &mutex() { return mutex_; }

	// Look up the inode and verify it hasn't been forgotten. Caller holds
	// mutex().
	Inode &find_inode(InodeId id);

	// Issue the next id to a new inode holding one lookup reference.
	std::pair<InodeId, Inode &> mint_inode(const InodeAttributes &attrs);

	// Abort if any inode still has an unexpected lookup count. For use after
	// unmounting.
	void check();

	uint64_t lookup_count(InodeId id);
	InodeId next_inode_id();

private:
	friend class InodeTableTestPeer;

	void check_invariants() const;

	const bool forget_delivery_reliable_;

	InodeMap inodes_;

	// Every key in inodes_ is below this.
	InodeId next_inode_id_{kFirstMintedInodeId};

	InvariantMutex mutex_;
};
