// DESS_X: device-level entry points, DESS_Y: instance-level entry points
DESS_Y(vkGetPhysicalDeviceProperties)
DESS_Y(vkGetPhysicalDeviceFeatures)
DESS_Y(vkGetPhysicalDeviceMemoryProperties)
DESS_Y(vkGetPhysicalDeviceMemoryProperties2)
DESS_Y(vkGetPhysicalDeviceQueueFamilyProperties)
DESS_Y(vkCreateDevice)

DESS_X(vkDestroyDevice)
DESS_X(vkGetDeviceQueue)
DESS_X(vkDeviceWaitIdle)
DESS_X(vkQueueSubmit2)

DESS_X(vkCreateCommandPool)
DESS_X(vkDestroyCommandPool)
DESS_X(vkResetCommandPool)
DESS_X(vkAllocateCommandBuffers)
DESS_X(vkBeginCommandBuffer)
DESS_X(vkEndCommandBuffer)
DESS_X(vkCmdCopyBuffer)

DESS_X(vkCreateFence)
DESS_X(vkDestroyFence)
DESS_X(vkWaitForFences)
DESS_X(vkResetFences)
DESS_X(vkCreateSemaphore)
DESS_X(vkDestroySemaphore)

DESS_X(vkCreateSampler)
DESS_X(vkDestroySampler)

DESS_X(vkCreateDescriptorPool)
DESS_X(vkDestroyDescriptorPool)
DESS_X(vkAllocateDescriptorSets)
DESS_X(vkFreeDescriptorSets)

DESS_X(vkCreateBuffer)
DESS_X(vkDestroyBuffer)
DESS_X(vkCreateImage)
DESS_X(vkDestroyImage)
DESS_X(vkAllocateMemory)
DESS_X(vkFreeMemory)
DESS_X(vkMapMemory)
DESS_X(vkUnmapMemory)
DESS_X(vkFlushMappedMemoryRanges)
DESS_X(vkInvalidateMappedMemoryRanges)
DESS_X(vkBindBufferMemory)
DESS_X(vkBindImageMemory)
DESS_X(vkBindBufferMemory2)
DESS_X(vkBindImageMemory2)
DESS_X(vkGetBufferMemoryRequirements)
DESS_X(vkGetImageMemoryRequirements)
DESS_X(vkGetBufferMemoryRequirements2)
DESS_X(vkGetImageMemoryRequirements2)
DESS_X(vkGetDeviceBufferMemoryRequirements)
DESS_X(vkGetDeviceImageMemoryRequirements)
