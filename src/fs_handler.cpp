#include "fs_handler.hpp"

int FsHandler::init()
{
	debug_print("init()");
	return 0;
}

int FsHandler::lookup(InodeId parent, std::string_view name, ChildEntry &entry)
{
	debug_print("lookup(): name={}, parent={}", name, parent);
	std::lock_guard<InvariantMutex> g{table_.mutex()};

	// Make sure the parent exists and has not been forgotten.
	table_.find_inode(parent);

	InodeId child_id;
	if (parent == kRootInodeId && name == "foo")
		child_id = kFooInodeId;
	else if (parent == kRootInodeId && name == "bar")
		child_id = kBarInodeId;
	else
		return ENOENT;

	Inode &child = table_.find_inode(child_id);
	child.increment_lookup_count();

	entry.child = child_id;
	entry.attributes = child.attributes;
	debug_print("lookup(): inode {} count now {}", child_id, child.lookup_count);
	return 0;
}

int FsHandler::getattr(InodeId ino, InodeAttributes &attr)
{
	debug_print("getattr(): inode={}", ino);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	attr = table_.find_inode(ino).attributes;
	return 0;
}

void FsHandler::forget(InodeId ino, uint64_t nlookup)
{
	debug_print("forget(): inode={}, nlookup={}", ino, nlookup);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	Inode &inode = table_.find_inode(ino);
	inode.decrement_lookup_count(nlookup);
	debug_print("forget: inode {} count now {}", ino, inode.lookup_count);
}

void FsHandler::forget_multi(const std::vector<ForgetRequest> &forgets)
{
	debug_print("forget_multi(): count={}", forgets.size());
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	for (const auto &f : forgets)
	{
		Inode &inode = table_.find_inode(f.ino);
		inode.decrement_lookup_count(f.nlookup);
		debug_print("forget_multi: inode {} count now {}", f.ino, inode.lookup_count);
	}
}

void FsHandler::mint_child(InodeId parent, mode_t mode, ChildEntry &entry)
{
	table_.find_inode(parent);

	// The child is never linked under any name, so nlink stays zero.
	auto [child_id, child] = table_.mint_inode(InodeAttributes{.nlink = 0, .mode = mode});

	entry.child = child_id;
	entry.attributes = child.attributes;
	debug_print("minted inode {} under parent {}", child_id, parent);
}

int FsHandler::mkdir(InodeId parent, ChildEntry &entry)
{
	debug_print("mkdir(): parent={}", parent);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	mint_child(parent, kDirMode, entry);
	return 0;
}

int FsHandler::create(InodeId parent, ChildEntry &entry)
{
	debug_print("create(): parent={}", parent);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	mint_child(parent, kFileMode, entry);
	return 0;
}

int FsHandler::open(InodeId ino)
{
	// Reads and writes are not supported; opening only verifies the inode.
	debug_print("open(): inode={}", ino);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	table_.find_inode(ino);
	return 0;
}

int FsHandler::opendir(InodeId ino)
{
	debug_print("opendir(): inode={}", ino);
	std::lock_guard<InvariantMutex> g{table_.mutex()};
	table_.find_inode(ino);
	return 0;
}
